#include "TransferSession.hpp"

#include <spdlog/spdlog.h>

namespace {
	TransferError MakeError(TransferError::Kind kind, std::string message)
	{
		return TransferError{ kind, std::move(message) };
	}

	TransferError AlreadyTerminal(const std::string& filename, const char* what)
	{
		return MakeError(TransferError::Kind::Internal,
				 fmt::format("{} called on finished transfer of '{}'", what, filename));
	}
}

TransferSession::TransferSession(std::string filename, int64_t total_chunks, std::unique_ptr<StorageWriter> writer)
    : filename_(std::move(filename))
    , declared_total_chunks_(total_chunks)
    , writer_(std::move(writer))
    , started_(std::chrono::steady_clock::now())
{
}

std::tuple<bool, std::unique_ptr<TransferSession>, TransferError>
TransferSession::Create(Storage& storage, const filetransfer::FileChunk& first_chunk) noexcept
{
    if (auto err = storage.CheckAvailable())
        return { false, nullptr, MakeError(TransferError::Kind::StorageUnavailable, err->message) };

    auto [ok, writer, err] = storage.OpenForWrite(first_chunk.filename());
    if (!ok)
        return { false, nullptr, MakeError(TransferError::Kind::StorageUnavailable,
                                           fmt::format("failed to open '{}': {}", first_chunk.filename(), err.message)) };

    std::unique_ptr<TransferSession> session(
        new TransferSession(first_chunk.filename(), first_chunk.total_chunks(), std::move(writer)));

    return { true, std::move(session), TransferError{} };
}

SessionState TransferSession::GetState() const noexcept
{
    SessionState state;

    state.filename = filename_;
    state.expected_next_chunk = expected_next_chunk_;
    state.declared_total_chunks = declared_total_chunks_;

    return state;
}

const std::string& TransferSession::GetFilename() const noexcept
{
    return filename_;
}

int64_t TransferSession::GetDeclaredTotalChunks() const noexcept
{
    return declared_total_chunks_;
}

int64_t TransferSession::GetChunksApplied() const noexcept
{
    return expected_next_chunk_ - 1;
}

int64_t TransferSession::GetBytesReceived() const noexcept
{
    return bytes_received_;
}

bool TransferSession::IsTerminal() const noexcept
{
    return terminal_;
}

const std::string& TransferSession::GetChecksum() const noexcept
{
    return digest_;
}

std::chrono::steady_clock::duration TransferSession::GetElapsed() const noexcept
{
    return std::chrono::steady_clock::now() - started_;
}

std::optional<TransferError> TransferSession::Apply(const filetransfer::FileChunk& chunk) noexcept
{
    if (terminal_)
        return AlreadyTerminal(filename_, "Apply");

    const std::string& data = chunk.data();

    if (auto err = writer_->Append(data))
        return MakeError(TransferError::Kind::StorageWriteError,
                         fmt::format("failed to write chunk {} of '{}': {}", chunk.chunk_number(), filename_, err->message));

    if (auto err = checksum_.Update(data))
        return MakeError(TransferError::Kind::Internal,
                         fmt::format("failed to hash chunk {} of '{}': {}", chunk.chunk_number(), filename_, err->message));

    bytes_received_ += static_cast<int64_t>(data.size());
    ++expected_next_chunk_;

    return std::nullopt;
}

TransferSession::Result TransferSession::Finalize(bool last_chunk_seen) noexcept
{
    if (terminal_)
        return { false, filetransfer::TransferResponse{}, AlreadyTerminal(filename_, "Finalize") };

    terminal_ = true;

    const bool complete = last_chunk_seen && GetChunksApplied() == declared_total_chunks_;
    if (!complete) {
        auto message = fmt::format("stream ended after {} of {} chunks", GetChunksApplied(), declared_total_chunks_);
        if (auto err = ReleaseWriter())
            message += fmt::format(" (close failed: {})", err->message);

        return { true, MakeResponse(false, std::move(message)), TransferError{} };
    }

    if (auto err = ReleaseWriter())
        return { true, MakeResponse(false, fmt::format("failed to store '{}': {}", filename_, err->message)), TransferError{} };

    auto [ok, digest, herr] = checksum_.Finalize();
    if (!ok)
        return { false, filetransfer::TransferResponse{},
                 MakeError(TransferError::Kind::Internal, fmt::format("failed to finalize checksum: {}", herr.message)) };

    digest_ = std::move(digest);

    return { true, MakeResponse(true, fmt::format("file {} received successfully", filename_)), TransferError{} };
}

TransferSession::Result TransferSession::Abort(const TransferError& cause) noexcept
{
    if (terminal_)
        return { false, filetransfer::TransferResponse{}, AlreadyTerminal(filename_, "Abort") };

    terminal_ = true;

    auto message = cause.message;
    if (auto err = ReleaseWriter()) {
        spdlog::warn("failed to close '{}' after aborted transfer: {}", filename_, err->message);
        message += fmt::format(" (close failed: {})", err->message);
    }

    return { true, MakeResponse(false, std::move(message)), TransferError{} };
}

std::optional<StorageError> TransferSession::ReleaseWriter() noexcept
{
    if (!writer_)
        return std::nullopt;

    auto err = writer_->Close();
    writer_.reset();

    return err;
}

filetransfer::TransferResponse TransferSession::MakeResponse(bool success, std::string message) const
{
    filetransfer::TransferResponse response;

    response.set_success(success);
    response.set_message(std::move(message));
    response.set_bytes_received(bytes_received_);

    return response;
}
