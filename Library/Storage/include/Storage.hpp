#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

struct StorageError {
	int code = 0;
	std::string message;
};

// True for a single path component: not empty, not "." or "..", and free of
// separators and NUL.
bool IsPlainFileName(std::string_view name) noexcept;

class StorageWriter
{
public:
	virtual ~StorageWriter() = default;

public:
	virtual std::optional<StorageError> Append(std::string_view data) noexcept = 0;

	// Makes appended data durable and releases the handle. Further calls
	// to Append() fail.
	virtual std::optional<StorageError> Close() noexcept = 0;
};

class StorageReader
{
public:
	virtual ~StorageReader() = default;

public:
	// { ok, bytes read, error }; bytes read is 0 at end of file.
	virtual std::tuple<bool, std::size_t, StorageError> ReadChunk(char* buffer, std::size_t size) noexcept = 0;
};

// Backend holding the destination files of transfers, addressed by plain
// file names.
class Storage
{
public:
	virtual ~Storage() = default;

public:
	virtual std::optional<StorageError> CheckAvailable() const noexcept = 0;

	// Opens (creating or truncating) the named file for appending.
	virtual std::tuple<bool, std::unique_ptr<StorageWriter>, StorageError> OpenForWrite(std::string_view name) noexcept = 0;
	virtual std::tuple<bool, std::unique_ptr<StorageReader>, StorageError> OpenForRead(std::string_view name) noexcept = 0;

	virtual bool Exists(std::string_view name) const noexcept = 0;
	virtual std::tuple<bool, uint64_t, StorageError> Size(std::string_view name) const noexcept = 0;
};
