#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "file_transfer.pb.h"

enum class ChunkRejection {
	EmptyFilename,
	UnsafeFilename,
	FilenameChanged,
	InvalidTotalChunks,
	TotalChunksChanged,
	SequenceMismatch,
	LastChunkFlagMismatch,
	EmptyData
};

// What the validator needs to know about a transfer in progress.
struct SessionState {
	std::string_view filename;
	int64_t expected_next_chunk = 1;
	int64_t declared_total_chunks = 0;

	// State a transfer would have before its first chunk is applied,
	// with the binding taken from that chunk.
	static SessionState ForFirstChunk(const filetransfer::FileChunk& chunk) noexcept;
};

struct Rejection {
	ChunkRejection reason;
	std::string message;
};

const char* ChunkRejectionName(ChunkRejection reason) noexcept;

// Checks one chunk against the state of its transfer. Has no side effects.
std::optional<Rejection> ValidateChunk(const SessionState& state, const filetransfer::FileChunk& chunk);
