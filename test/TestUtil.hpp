#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <mutex>
#include <random>
#include <string>
#include <thread>
#include <vector>

#include <grpcpp/support/sync_stream.h>

#include "file_transfer.pb.h"

#include "LocalStorage.hpp"

namespace testutil {

// Fresh directory under the system temp dir, removed on destruction.
class TempDir
{
public:
	TempDir()
	{
		static std::atomic<int> counter{0};

		std::random_device rd;
		path_ = std::filesystem::temp_directory_path() /
			("file_transfer_test_" + std::to_string(rd()) + "_" + std::to_string(counter++));
		std::filesystem::create_directories(path_);
	}

	~TempDir()
	{
		std::error_code ec;
		std::filesystem::remove_all(path_, ec);
	}

	TempDir(const TempDir&) = delete;
	TempDir& operator=(const TempDir&) = delete;

	const std::filesystem::path& path() const { return path_; }

private:
	std::filesystem::path path_;
};

inline std::string ReadFile(const std::filesystem::path& path)
{
	std::ifstream in(path, std::ios::binary);
	return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void WriteFile(const std::filesystem::path& path, const std::string& content)
{
	std::ofstream out(path, std::ios::binary | std::ios::trunc);
	out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

inline std::string RandomBytes(size_t size, uint32_t seed = 7)
{
	std::mt19937 gen(seed);
	std::uniform_int_distribution<int> dist(0, 255);

	std::string out(size, '\0');
	for (auto& c : out)
		c = static_cast<char>(dist(gen));

	return out;
}

inline filetransfer::FileChunk MakeChunk(const std::string& filename, const std::string& data,
					 int64_t number, int64_t total, bool last)
{
	filetransfer::FileChunk chunk;

	chunk.set_filename(filename);
	chunk.set_data(data);
	chunk.set_chunk_number(number);
	chunk.set_total_chunks(total);
	chunk.set_is_last_chunk(last);

	return chunk;
}

// Well-formed chunk sequence for content; an empty content yields one empty
// chunk.
inline std::vector<filetransfer::FileChunk> SplitIntoChunks(const std::string& filename,
							    const std::string& content,
							    size_t chunk_size)
{
	std::vector<filetransfer::FileChunk> chunks;

	const int64_t total = content.empty() ? 1 : static_cast<int64_t>((content.size() + chunk_size - 1) / chunk_size);
	for (int64_t i = 0; i < total; ++i) {
		const size_t offset = static_cast<size_t>(i) * chunk_size;
		const std::string part = offset < content.size() ? content.substr(offset, chunk_size) : std::string();
		chunks.push_back(MakeChunk(filename, part, i + 1, total, i + 1 == total));
	}

	return chunks;
}

// In-memory stand-in for a gRPC server reader. With hang_at_end set, Read()
// blocks after the last chunk until Cancel() is called, like a client that
// keeps the stream open without sending. Once cancelled every Read() fails,
// as it does on a cancelled call.
class FakeChunkReader final : public grpc::ServerReaderInterface<filetransfer::FileChunk>
{
public:
	explicit FakeChunkReader(std::vector<filetransfer::FileChunk> chunks, bool hang_at_end = false)
		: chunks_(std::move(chunks)), hang_at_end_(hang_at_end) { }

	void SendInitialMetadata() override { }

	bool NextMessageSize(uint32_t* sz) override
	{
		if (next_ >= chunks_.size())
			return false;

		*sz = static_cast<uint32_t>(chunks_[next_].ByteSizeLong());
		return true;
	}

	bool Read(filetransfer::FileChunk* msg) override
	{
		std::unique_lock<std::mutex> lock(mutex_);

		if (cancelled_)
			return false;

		if (next_ < chunks_.size()) {
			*msg = chunks_[next_++];
			return true;
		}

		if (hang_at_end_)
			cv_.wait(lock, [this] { return cancelled_; });

		return false;
	}

	void Cancel()
	{
		{
			std::lock_guard<std::mutex> lock(mutex_);
			cancelled_ = true;
		}
		cv_.notify_all();
	}

	size_t GetReadCount() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return next_;
	}

	bool IsCancelled() const
	{
		std::lock_guard<std::mutex> lock(mutex_);
		return cancelled_;
	}

private:
	std::vector<filetransfer::FileChunk> chunks_;
	size_t next_ = 0;
	const bool hang_at_end_;

	mutable std::mutex mutex_;
	std::condition_variable cv_;
	bool cancelled_ = false;
};

// LocalStorage with injectable failures and latency.
class FaultyStorage final : public Storage
{
public:
	explicit FaultyStorage(const std::filesystem::path& root) : inner_(root) { }

	bool unavailable = false;
	bool fail_open = false;
	// number of appends that succeed before every later append fails; -1 never fails
	int appends_before_failure = -1;
	std::chrono::milliseconds append_delay{0};
	std::chrono::milliseconds close_delay{0};
	// errno reported by OpenForRead() when non-zero
	int read_open_errno = 0;

	std::optional<StorageError> CheckAvailable() const noexcept override
	{
		if (unavailable)
			return StorageError{ -1, "storage offline" };
		return inner_.CheckAvailable();
	}

	std::tuple<bool, std::unique_ptr<StorageWriter>, StorageError> OpenForWrite(std::string_view name) noexcept override
	{
		if (fail_open)
			return { false, nullptr, StorageError{ -1, "open refused" } };

		auto [ok, writer, err] = inner_.OpenForWrite(name);
		if (!ok)
			return { false, nullptr, err };

		return { true, std::make_unique<Writer>(std::move(writer), *this), StorageError{} };
	}

	std::tuple<bool, std::unique_ptr<StorageReader>, StorageError> OpenForRead(std::string_view name) noexcept override
	{
		if (read_open_errno != 0)
			return { false, nullptr, StorageError{ read_open_errno, "open for read refused" } };

		return inner_.OpenForRead(name);
	}

	bool Exists(std::string_view name) const noexcept override
	{
		return inner_.Exists(name);
	}

	std::tuple<bool, uint64_t, StorageError> Size(std::string_view name) const noexcept override
	{
		return inner_.Size(name);
	}

	int GetCloseCount() const { return closes_; }

private:
	class Writer final : public StorageWriter
	{
	public:
		Writer(std::unique_ptr<StorageWriter> inner, FaultyStorage& owner)
			: inner_(std::move(inner)), owner_(owner) { }

		std::optional<StorageError> Append(std::string_view data) noexcept override
		{
			if (owner_.appends_before_failure == 0)
				return StorageError{ 28, "no space left on device" };
			if (owner_.appends_before_failure > 0)
				--owner_.appends_before_failure;

			std::this_thread::sleep_for(owner_.append_delay);

			return inner_->Append(data);
		}

		std::optional<StorageError> Close() noexcept override
		{
			++owner_.closes_;
			std::this_thread::sleep_for(owner_.close_delay);
			return inner_->Close();
		}

	private:
		std::unique_ptr<StorageWriter> inner_;
		FaultyStorage& owner_;
	};

	LocalStorage inner_;
	int closes_ = 0;
};

} // namespace testutil
