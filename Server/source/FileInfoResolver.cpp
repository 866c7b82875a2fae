#include "FileInfoResolver.hpp"

#include <cerrno>
#include <vector>

#include <spdlog/spdlog.h>

#include "ChecksumAccumulator.hpp"

namespace {
	filetransfer::FileInfoResponse Missing()
	{
		filetransfer::FileInfoResponse response;

		response.set_exists(false);
		response.set_file_size(0);
		response.set_checksum("");

		return response;
	}

	TransferError Unavailable(std::string message)
	{
		return TransferError{ TransferError::Kind::StorageUnavailable, std::move(message) };
	}

	// The backend is reachable; the error belongs to this one file.
	std::tuple<bool, filetransfer::FileInfoResponse, TransferError>
	FileError(const std::string& filename, const StorageError& err)
	{
		if (err.code == ENOENT) {
			spdlog::debug("'{}' vanished while it was inspected: {}", filename, err.message);
			return { true, Missing(), TransferError{} };
		}

		return { false, filetransfer::FileInfoResponse{}, TransferError{ TransferError::Kind::Internal, err.message } };
	}
}

FileInfoResolver::FileInfoResolver(Storage& storage, size_t read_size)
    : storage_(storage)
    , read_size_(read_size == 0 ? kDefaultReadSize : read_size)
{
}

std::tuple<bool, filetransfer::FileInfoResponse, TransferError>
FileInfoResolver::Resolve(const std::string& filename) const noexcept
{
    if (auto err = storage_.CheckAvailable())
        return { false, filetransfer::FileInfoResponse{}, Unavailable(err->message) };

    if (!storage_.Exists(filename))
        return { true, Missing(), TransferError{} };

    auto [size_ok, size, size_err] = storage_.Size(filename);
    if (!size_ok)
        return FileError(filename, size_err);

    auto [open_ok, reader, open_err] = storage_.OpenForRead(filename);
    if (!open_ok)
        return FileError(filename, open_err);

    ChecksumAccumulator checksum;
    std::vector<char> buffer(read_size_);
    uint64_t total = 0;

    while (true) {
        auto [ok, n, err] = reader->ReadChunk(buffer.data(), buffer.size());
        if (!ok)
            return { false, filetransfer::FileInfoResponse{}, TransferError{ TransferError::Kind::Internal, err.message } };

        if (n == 0)
            break;

        if (auto herr = checksum.Update(std::string_view(buffer.data(), n)))
            return { false, filetransfer::FileInfoResponse{},
                     TransferError{ TransferError::Kind::Internal, herr->message } };

        total += n;
    }

    auto [digest_ok, digest, herr] = checksum.Finalize();
    if (!digest_ok)
        return { false, filetransfer::FileInfoResponse{}, TransferError{ TransferError::Kind::Internal, herr.message } };

    // the reported size always describes the hashed bytes
    if (total != size)
        spdlog::warn("'{}' changed while it was read: size {} at open, {} bytes read", filename, size, total);

    filetransfer::FileInfoResponse response;

    response.set_exists(true);
    response.set_file_size(static_cast<int64_t>(total));
    response.set_checksum(digest);

    return { true, std::move(response), TransferError{} };
}
