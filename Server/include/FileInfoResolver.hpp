#pragma once

#include <cstddef>
#include <string>
#include <tuple>

#include "file_transfer.pb.h"

#include "Storage.hpp"
#include "TransferError.hpp"

// Answers GetFileInfo queries straight from storage. Nothing is cached; the
// checksum is recomputed by streaming the file through a ChecksumAccumulator.
class FileInfoResolver
{
public:
	explicit FileInfoResolver(Storage& storage, size_t read_size = kDefaultReadSize);

public:
	std::tuple<bool, filetransfer::FileInfoResponse, TransferError> Resolve(const std::string& filename) const noexcept;

public:
	static constexpr size_t kDefaultReadSize = 64 * 1024;

private:
	Storage& storage_;
	const size_t read_size_;
};
