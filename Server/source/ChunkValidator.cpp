#include "ChunkValidator.hpp"

#include "fmt/core.h"

#include "Storage.hpp"

namespace {
	Rejection Reject(ChunkRejection reason, std::string message)
	{
		return Rejection{ reason, std::move(message) };
	}
}

SessionState SessionState::ForFirstChunk(const filetransfer::FileChunk& chunk) noexcept
{
    SessionState state;

    state.filename = chunk.filename();
    state.expected_next_chunk = 1;
    state.declared_total_chunks = chunk.total_chunks();

    return state;
}

const char* ChunkRejectionName(ChunkRejection reason) noexcept
{
    switch (reason) {
    case ChunkRejection::EmptyFilename:         return "EmptyFilename";
    case ChunkRejection::UnsafeFilename:        return "UnsafeFilename";
    case ChunkRejection::FilenameChanged:       return "FilenameChanged";
    case ChunkRejection::InvalidTotalChunks:    return "InvalidTotalChunks";
    case ChunkRejection::TotalChunksChanged:    return "TotalChunksChanged";
    case ChunkRejection::SequenceMismatch:      return "SequenceMismatch";
    case ChunkRejection::LastChunkFlagMismatch: return "LastChunkFlagMismatch";
    case ChunkRejection::EmptyData:             return "EmptyData";
    }

    return "Unknown";
}

std::optional<Rejection> ValidateChunk(const SessionState& state, const filetransfer::FileChunk& chunk)
{
    const std::string& filename = chunk.filename();
    const int64_t number = chunk.chunk_number();
    const int64_t total = chunk.total_chunks();

    if (filename.empty())
        return Reject(ChunkRejection::EmptyFilename, "filename is empty");

    if (!IsPlainFileName(filename))
        return Reject(ChunkRejection::UnsafeFilename,
                      fmt::format("filename '{}' is not a plain file name", filename));

    if (filename != state.filename)
        return Reject(ChunkRejection::FilenameChanged,
                      fmt::format("filename changed from '{}' to '{}'", state.filename, filename));

    if (total <= 0 || number <= 0 || number > total)
        return Reject(ChunkRejection::InvalidTotalChunks,
                      fmt::format("chunk {} of {} is out of range", number, total));

    if (total != state.declared_total_chunks)
        return Reject(ChunkRejection::TotalChunksChanged,
                      fmt::format("total_chunks changed from {} to {}", state.declared_total_chunks, total));

    if (number != state.expected_next_chunk)
        return Reject(ChunkRejection::SequenceMismatch,
                      fmt::format("expected chunk {}, got {}", state.expected_next_chunk, number));

    if (chunk.is_last_chunk() != (number == total))
        return Reject(ChunkRejection::LastChunkFlagMismatch,
                      fmt::format("is_last_chunk={} on chunk {} of {}", chunk.is_last_chunk(), number, total));

    if (chunk.data().empty() && total != 1)
        return Reject(ChunkRejection::EmptyData,
                      fmt::format("chunk {} of {} carries no data", number, total));

    return std::nullopt;
}
