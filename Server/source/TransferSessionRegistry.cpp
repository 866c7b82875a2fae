#include "TransferSessionRegistry.hpp"

#include <spdlog/spdlog.h>

TransferSessionRegistry::TransferSessionRegistry(Storage& storage, bool exclusive_filenames)
    : storage_(storage)
    , exclusive_filenames_(exclusive_filenames)
{
}

TransferSessionRegistry::StreamId TransferSessionRegistry::NextStreamId() noexcept
{
    return next_id_.fetch_add(1, std::memory_order_relaxed);
}

std::tuple<bool, TransferSession*, TransferError>
TransferSessionRegistry::GetOrCreate(StreamId id, const filetransfer::FileChunk& first_chunk) noexcept
{
    const std::string& filename = first_chunk.filename();

    {
        std::lock_guard<std::mutex> lock(mutex_);

        if (auto it = sessions_.find(id); it != sessions_.end())
            return { true, it->second.get(), TransferError{} };

        if (exclusive_filenames_) {
            auto owner = owners_.find(filename);
            if (owner != owners_.end())
                return { false, nullptr, TransferError{ TransferError::Kind::FileBusy,
                    fmt::format("'{}' is being written by another transfer", filename) } };

            // reserve the name while the destination is opened outside the lock
            owners_.emplace(filename, id);
        }
    }

    auto [ok, session, err] = TransferSession::Create(storage_, first_chunk);

    std::lock_guard<std::mutex> lock(mutex_);

    if (!ok) {
        if (exclusive_filenames_)
            owners_.erase(filename);
        return { false, nullptr, std::move(err) };
    }

    TransferSession* raw = session.get();
    sessions_.emplace(id, std::move(session));

    spdlog::debug("stream {}: session created for '{}' ({} active)", id, filename, sessions_.size());

    return { true, raw, TransferError{} };
}

TransferSession* TransferSessionRegistry::Find(StreamId id) const noexcept
{
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second.get();
}

bool TransferSessionRegistry::Remove(StreamId id) noexcept
{
    std::unique_ptr<TransferSession> removed;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = sessions_.find(id);
        if (it == sessions_.end())
            return false;

        removed = std::move(it->second);
        sessions_.erase(it);

        auto owner = owners_.find(removed->GetFilename());
        if (owner != owners_.end() && owner->second == id)
            owners_.erase(owner);
    }

    spdlog::debug("stream {}: session for '{}' removed", id, removed->GetFilename());

    return true;
}

size_t TransferSessionRegistry::GetActiveCount() const noexcept
{
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

bool TransferSessionRegistry::IsBusy(std::string_view filename) const noexcept
{
    std::lock_guard<std::mutex> lock(mutex_);
    return owners_.find(filename) != owners_.end();
}
