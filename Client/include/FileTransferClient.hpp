#pragma once

#include "file_transfer.grpc.pb.h"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <tuple>

#include <grpcpp/grpcpp.h>

#include "file_transfer.pb.h"

#include "ChannelOptions.hpp"

class FileTransferClient
{
public:
	struct Error {
		int code;
		std::string message;
	};

public:
	explicit FileTransferClient(std::shared_ptr<grpc::Channel> channel, size_t chunk_size = kDefaultChunkSize);

public:
	// { rpc ok, server response, error }. A rejected transfer is still an
	// ok call; check response.success().
	std::tuple<bool, filetransfer::TransferResponse, Error>
	SendFile(const std::filesystem::path& infile, const std::string& remote_name);

	std::tuple<bool, filetransfer::FileInfoResponse, Error> GetFileInfo(const std::string& remote_name);

	// { ok, checksums match, error }
	std::tuple<bool, bool, Error> VerifyFile(const std::string& remote_name, const std::filesystem::path& local_file);

public:
	static std::tuple<bool, std::string, Error> ComputeChecksum(const std::filesystem::path& file);

	// A chunk of this size with its envelope still fits the message limit.
	static bool IsValidChunkSize(long long chunk_size, int max_message_size = kDefaultMaxMessageSize) noexcept;

	static constexpr size_t kDefaultChunkSize = 1024 * 1024;

private:
	using WriterPtr = std::unique_ptr<grpc::ClientWriter<filetransfer::FileChunk>>;

	std::optional<Error> SendChunks(WriterPtr& writer, const std::filesystem::path& infile, const std::string& remote_name);

private:
	std::unique_ptr<filetransfer::FileTransferService::Stub> stub_;
	const size_t chunk_size_;
};
