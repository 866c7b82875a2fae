#pragma once

#include <filesystem>
#include <optional>

#include "Storage.hpp"

// Storage rooted at one directory of the local filesystem. Names are mapped
// to direct children of the root; anything that is not a plain file name is
// refused.
class LocalStorage final : public Storage
{
public:
	explicit LocalStorage(const std::filesystem::path& root_dir);

public:
	const std::filesystem::path& GetRoot() const noexcept;

	std::optional<StorageError> CheckAvailable() const noexcept override;

	std::tuple<bool, std::unique_ptr<StorageWriter>, StorageError> OpenForWrite(std::string_view name) noexcept override;
	std::tuple<bool, std::unique_ptr<StorageReader>, StorageError> OpenForRead(std::string_view name) noexcept override;

	bool Exists(std::string_view name) const noexcept override;
	std::tuple<bool, uint64_t, StorageError> Size(std::string_view name) const noexcept override;

private:
	std::optional<std::filesystem::path> Resolve(std::string_view name) const noexcept;

private:
	const std::filesystem::path root_dir_;
};
