#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <tuple>

#include "file_transfer.pb.h"

#include "Storage.hpp"
#include "TransferError.hpp"
#include "TransferSession.hpp"

// Sessions of the streams currently in flight, keyed by a per-call stream id.
// Ids come from a counter and are never reused during the process lifetime.
//
// With exclusive filenames enabled, a filename can be bound to at most one
// live session; writes from two streams to the same file are otherwise
// interleaved in undefined order.
class TransferSessionRegistry
{
public:
	using StreamId = uint64_t;

public:
	explicit TransferSessionRegistry(Storage& storage, bool exclusive_filenames = true);

	TransferSessionRegistry(const TransferSessionRegistry&) = delete;
	TransferSessionRegistry& operator=(const TransferSessionRegistry&) = delete;

public:
	StreamId NextStreamId() noexcept;

	// Returns the session of the stream, creating it from the first chunk
	// when none exists yet. The pointer stays valid until Remove(id).
	std::tuple<bool, TransferSession*, TransferError> GetOrCreate(StreamId id, const filetransfer::FileChunk& first_chunk) noexcept;

	TransferSession* Find(StreamId id) const noexcept;
	bool Remove(StreamId id) noexcept;

	size_t GetActiveCount() const noexcept;
	bool IsBusy(std::string_view filename) const noexcept;

private:
	Storage& storage_;
	const bool exclusive_filenames_;

	std::atomic<StreamId> next_id_{1};

	mutable std::mutex mutex_;
	std::map<StreamId, std::unique_ptr<TransferSession>> sessions_;
	std::map<std::string, StreamId, std::less<>> owners_;
};
