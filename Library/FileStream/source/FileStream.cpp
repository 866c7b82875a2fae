#include "FileStream.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace {
	int ToOpenFlags(std::ios::openmode mode) noexcept
	{
		const bool in  = (mode & std::ios::in) != 0;
		const bool out = (mode & (std::ios::out | std::ios::app | std::ios::trunc)) != 0;

		int flags = O_CLOEXEC;
		if (in && out)
			flags |= O_RDWR;
		else if (out)
			flags |= O_WRONLY;
		else
			flags |= O_RDONLY;

		if (out)
			flags |= O_CREAT;
		if ((mode & std::ios::trunc) != 0)
			flags |= O_TRUNC;
		if ((mode & std::ios::app) != 0)
			flags |= O_APPEND;

		return flags;
	}
}

FileStream::FileStream(const std::filesystem::path& path)
    : path_(path)
{
}

FileStream::~FileStream()
{
    if (fd_ >= 0)
        ::close(fd_);
}

const std::filesystem::path& FileStream::GetPath() const noexcept
{
    return path_;
}

bool FileStream::IsOpen() const noexcept
{
    return fd_ >= 0;
}

std::optional<FileStream::Error> FileStream::Open(std::ios::openmode mode) noexcept
{
    if (fd_ >= 0) {
        if (auto err = Close())
            return err;
    }

    int fd;
    do {
        fd = ::open(path_.c_str(), ToOpenFlags(mode), 0644);
    } while (fd < 0 && errno == EINTR);

    if (fd < 0)
        return errno_error(errno, "open");

    fd_ = fd;

    return std::nullopt;
}

std::optional<FileStream::Error> FileStream::Write(std::string_view data) noexcept
{
    if (fd_ < 0)
        return Error{-1, "write: stream is not open"};

    const char* cursor = data.data();
    size_t remaining = data.size();

    while (remaining > 0) {
        const ssize_t n = ::write(fd_, cursor, remaining);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return errno_error(errno, "write");
        }

        cursor += n;
        remaining -= static_cast<size_t>(n);
    }

    return std::nullopt;
}

std::tuple<bool, std::streamsize, FileStream::Error> FileStream::Read(std::string& data) noexcept
{
    if (data.empty())
        return { true, 0, Error{} };

    return Read(data.data(), static_cast<std::streamsize>(data.size()));
}

std::tuple<bool, std::streamsize, FileStream::Error> FileStream::Read(char* data, std::streamsize size) noexcept
{
    if (fd_ < 0)
        return { false, 0, Error{ -1, "read: stream is not open"} };

    if (size < 0)
        return { false, 0, Error{ -1, "read: invalid size"} };

    if (size == 0)
        return { true, 0, Error{} };

    if (!data)
        return { false, 0, Error{ -1, "read: null buffer with non-zero size"} };

    // fill the buffer unless end of file comes first; 0 means end of file
    std::streamsize total = 0;
    while (total < size) {
        const ssize_t n = ::read(fd_, data + total, static_cast<size_t>(size - total));
        if (n < 0) {
            if (errno == EINTR)
                continue;
            return { false, total, errno_error(errno, "read") };
        }

        if (n == 0)
            break;

        total += n;
    }

    return { true, total, Error{} };
}

std::optional<FileStream::Error> FileStream::Sync() noexcept
{
    if (fd_ < 0)
        return Error{-1, "sync: stream is not open"};

    if (::fsync(fd_) != 0)
        return errno_error(errno, "sync");

    return std::nullopt;
}

std::optional<FileStream::Error> FileStream::Close() noexcept
{
    if (fd_ < 0)
        return std::nullopt;

    const int fd = fd_;
    fd_ = -1;

    // the descriptor is released even when close reports an error
    if (::close(fd) != 0 && errno != EINTR)
        return errno_error(errno, "close");

    return std::nullopt;
}

FileStream::Error FileStream::errno_error(int err, const char* context) const noexcept
{
    std::ostringstream oss;
    oss << (context ? context : "stream")
        << ": errno=" << err << " (" << std::strerror(err) << ")"
        << ", path=" << path_.string();

    return Error{ err, oss.str() };
}
