#pragma once

#include "file_transfer.grpc.pb.h"
#include "file_transfer.pb.h"

#include <chrono>
#include <functional>

#include <grpcpp/support/sync_stream.h>

#include "FileInfoResolver.hpp"
#include "TransferSessionRegistry.hpp"

class TransferServiceImpl final : public filetransfer::FileTransferService::Service
{
public:
	using ChunkReader = grpc::ServerReaderInterface<filetransfer::FileChunk>;

	enum class StreamState {
		AwaitingFirstChunk,
		Receiving,
		Finalizing
	};

public:
	TransferServiceImpl(TransferSessionRegistry& registry,
			    const FileInfoResolver& resolver,
			    std::chrono::milliseconds idle_timeout);

public:
	// Runs the receive loop of one TransferFile call. cancel is invoked if
	// the idle-chunk timeout expires; it must make reader->Read() return.
	grpc::Status ReceiveTransfer(ChunkReader* reader,
				     filetransfer::TransferResponse* response,
				     const std::function<void()>& cancel);

	grpc::Status TransferFile(grpc::ServerContext* context,
				  grpc::ServerReader<filetransfer::FileChunk>* reader,
				  filetransfer::TransferResponse* response) override;

	grpc::Status GetFileInfo(grpc::ServerContext* context,
				 const filetransfer::FileInfoRequest* request,
				 filetransfer::FileInfoResponse* response) override;

private:
	TransferSessionRegistry& registry_;
	const FileInfoResolver& resolver_;
	const std::chrono::milliseconds idle_timeout_;
};
