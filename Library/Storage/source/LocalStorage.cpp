#include "LocalStorage.hpp"

#include <system_error>

#include "fmt/core.h"

#include "FileStream.hpp"

namespace fs = std::filesystem;

namespace {
	StorageError FromStreamError(const FileStream::Error& err)
	{
		return StorageError{ err.code, err.message };
	}

	class LocalWriter final : public StorageWriter
	{
	public:
		explicit LocalWriter(std::unique_ptr<FileStream> stream)
			: stream_(std::move(stream)) { }

		~LocalWriter() override
		{
			(void)stream_->Close();
		}

	public:
		std::optional<StorageError> Append(std::string_view data) noexcept override
		{
			if (auto err = stream_->Write(data))
				return FromStreamError(*err);

			return std::nullopt;
		}

		std::optional<StorageError> Close() noexcept override
		{
			if (!stream_->IsOpen())
				return std::nullopt;

			if (auto err = stream_->Sync()) {
				(void)stream_->Close();
				return FromStreamError(*err);
			}

			if (auto err = stream_->Close())
				return FromStreamError(*err);

			return std::nullopt;
		}

	private:
		std::unique_ptr<FileStream> stream_;
	};

	class LocalReader final : public StorageReader
	{
	public:
		explicit LocalReader(std::unique_ptr<FileStream> stream)
			: stream_(std::move(stream)) { }

		~LocalReader() override
		{
			(void)stream_->Close();
		}

	public:
		std::tuple<bool, std::size_t, StorageError> ReadChunk(char* buffer, std::size_t size) noexcept override
		{
			auto [ok, n, err] = stream_->Read(buffer, static_cast<std::streamsize>(size));
			if (!ok)
				return { false, 0, FromStreamError(err) };

			return { true, static_cast<std::size_t>(n), StorageError{} };
		}

	private:
		std::unique_ptr<FileStream> stream_;
	};
}

LocalStorage::LocalStorage(const fs::path& root_dir)
    : root_dir_(root_dir)
{
}

const fs::path& LocalStorage::GetRoot() const noexcept
{
    return root_dir_;
}

std::optional<fs::path> LocalStorage::Resolve(std::string_view name) const noexcept
{
    if (!IsPlainFileName(name))
        return std::nullopt;

    return root_dir_ / fs::path(std::string(name));
}

std::optional<StorageError> LocalStorage::CheckAvailable() const noexcept
{
    std::error_code ec;

    if (root_dir_.empty())
        return StorageError{ -1, "storage root is not set" };

    if (!fs::is_directory(root_dir_, ec))
        return StorageError{ ec.value(), fmt::format("storage root {} is not a directory", root_dir_.string()) };

    return std::nullopt;
}

std::tuple<bool, std::unique_ptr<StorageWriter>, StorageError>
LocalStorage::OpenForWrite(std::string_view name) noexcept
{
    const auto path = Resolve(name);
    if (!path)
        return { false, nullptr, StorageError{ -1, fmt::format("invalid file name '{}'", name) } };

    if (auto err = CheckAvailable())
        return { false, nullptr, *err };

    auto stream = std::make_unique<FileStream>(*path);
    if (auto err = stream->Open(std::ios::binary | std::ios::out | std::ios::trunc))
        return { false, nullptr, FromStreamError(*err) };

    return { true, std::make_unique<LocalWriter>(std::move(stream)), StorageError{} };
}

std::tuple<bool, std::unique_ptr<StorageReader>, StorageError>
LocalStorage::OpenForRead(std::string_view name) noexcept
{
    const auto path = Resolve(name);
    if (!path)
        return { false, nullptr, StorageError{ -1, fmt::format("invalid file name '{}'", name) } };

    auto stream = std::make_unique<FileStream>(*path);
    if (auto err = stream->Open(std::ios::binary | std::ios::in))
        return { false, nullptr, FromStreamError(*err) };

    return { true, std::make_unique<LocalReader>(std::move(stream)), StorageError{} };
}

bool LocalStorage::Exists(std::string_view name) const noexcept
{
    const auto path = Resolve(name);
    if (!path)
        return false;

    std::error_code ec;
    return fs::is_regular_file(*path, ec);
}

std::tuple<bool, uint64_t, StorageError> LocalStorage::Size(std::string_view name) const noexcept
{
    const auto path = Resolve(name);
    if (!path)
        return { false, 0, StorageError{ -1, fmt::format("invalid file name '{}'", name) } };

    std::error_code ec;
    const uintmax_t size = fs::file_size(*path, ec);
    if (ec)
        return { false, 0, StorageError{ ec.value(), fmt::format("file_size {}: {}", path->string(), ec.message()) } };

    return { true, static_cast<uint64_t>(size), StorageError{} };
}
