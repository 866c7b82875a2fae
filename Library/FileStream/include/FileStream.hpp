#pragma once

#include <filesystem>
#include <ios>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>

// Unbuffered file access over a POSIX descriptor. The open mode follows
// std::ios semantics (in, out, trunc, app) so callers read like fstream code.
class FileStream {
public:
	struct Error {
		int code = 0;
		std::string message;
	};

public:
	explicit FileStream(const std::filesystem::path& path);
	~FileStream();

	FileStream(const FileStream&) = delete;
	FileStream& operator=(const FileStream&) = delete;

public:
	const std::filesystem::path& GetPath() const noexcept;
	bool IsOpen() const noexcept;

public:
	std::optional<Error> Open(std::ios::openmode mode) noexcept;
	std::optional<Error> Write(std::string_view data) noexcept;

	std::tuple<bool, std::streamsize, Error> Read(std::string& data) noexcept;
	std::tuple<bool, std::streamsize, Error> Read(char* data, std::streamsize size) noexcept;

	std::optional<Error> Sync() noexcept;
	std::optional<Error> Close() noexcept;

private:
	Error errno_error(int err, const char* context) const noexcept;

private:
	const std::filesystem::path path_;
	int fd_ = -1;
};
