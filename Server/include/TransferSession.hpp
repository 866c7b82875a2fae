#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <tuple>

#include "file_transfer.pb.h"

#include "ChecksumAccumulator.hpp"
#include "ChunkValidator.hpp"
#include "Storage.hpp"
#include "TransferError.hpp"

// Server-side state of one transfer. Owned by the handler of a single
// stream; only that handler mutates it.
class TransferSession
{
public:
	using Result = std::tuple<bool, filetransfer::TransferResponse, TransferError>;

public:
	// Opens (or truncates) the destination named by the first chunk. The
	// chunk itself is not applied.
	static std::tuple<bool, std::unique_ptr<TransferSession>, TransferError>
	Create(Storage& storage, const filetransfer::FileChunk& first_chunk) noexcept;

	TransferSession(const TransferSession&) = delete;
	TransferSession& operator=(const TransferSession&) = delete;

public:
	SessionState GetState() const noexcept;

	const std::string& GetFilename() const noexcept;
	int64_t GetDeclaredTotalChunks() const noexcept;
	int64_t GetChunksApplied() const noexcept;
	int64_t GetBytesReceived() const noexcept;
	bool IsTerminal() const noexcept;

	// Lowercase hex digest of the received bytes, set by a successful
	// Finalize().
	const std::string& GetChecksum() const noexcept;
	std::chrono::steady_clock::duration GetElapsed() const noexcept;

public:
	// The chunk must already have passed ValidateChunk() against GetState().
	std::optional<TransferError> Apply(const filetransfer::FileChunk& chunk) noexcept;

	Result Finalize(bool last_chunk_seen) noexcept;

	// Ends the transfer with a failure caused outside the session, such as
	// a rejected chunk or a failed write. The partial file stays in storage.
	Result Abort(const TransferError& cause) noexcept;

private:
	TransferSession(std::string filename, int64_t total_chunks, std::unique_ptr<StorageWriter> writer);

	std::optional<StorageError> ReleaseWriter() noexcept;
	filetransfer::TransferResponse MakeResponse(bool success, std::string message) const;

private:
	const std::string filename_;
	const int64_t declared_total_chunks_;
	int64_t expected_next_chunk_ = 1;
	int64_t bytes_received_ = 0;

	ChecksumAccumulator checksum_;
	std::string digest_;

	std::unique_ptr<StorageWriter> writer_;
	bool terminal_ = false;

	const std::chrono::steady_clock::time_point started_;
};
