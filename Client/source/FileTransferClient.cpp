#include "FileTransferClient.hpp"

#include <chrono>
#include <system_error>
#include <vector>

#include <cstdint>

#include <spdlog/spdlog.h>

#include "ChecksumAccumulator.hpp"
#include "FileStream.hpp"

namespace {
	constexpr int64_t kProgressInterval = 100;
	constexpr double kMiB = 1024.0 * 1024.0;

	static FileTransferClient::Error OkError()
	{
		return FileTransferClient::Error{ 0, "" };
	}

	static FileTransferClient::Error MakeErr(int code, std::string msg)
	{
		return FileTransferClient::Error{ code, std::move(msg) };
	}

	static FileTransferClient::Error MakeGrpcErr(const grpc::Status& st)
	{
		return FileTransferClient::Error{ static_cast<int>(st.error_code()), st.error_message() };
	}
}

FileTransferClient::FileTransferClient(std::shared_ptr<grpc::Channel> channel, size_t chunk_size)
    : stub_(filetransfer::FileTransferService::NewStub(std::move(channel)))
    , chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size)
{
}

bool FileTransferClient::IsValidChunkSize(long long chunk_size, int max_message_size) noexcept
{
    return chunk_size > 0 && chunk_size <= static_cast<long long>(max_message_size) - kChunkEnvelopeReserve;
}

std::tuple<bool, filetransfer::TransferResponse, FileTransferClient::Error>
FileTransferClient::SendFile(const std::filesystem::path& infile, const std::string& remote_name)
{
    if (!stub_)
        return { false, filetransfer::TransferResponse{}, MakeErr(-1, "stub not initialized") };

    if (infile.empty() || remote_name.empty())
        return { false, filetransfer::TransferResponse{}, MakeErr(-1, "infile/remote name is empty") };

    const auto start = std::chrono::steady_clock::now();

    grpc::ClientContext ctx;
    filetransfer::TransferResponse resp;

    WriterPtr writer = stub_->TransferFile(&ctx, &resp);
    if (!writer)
        return { false, filetransfer::TransferResponse{}, MakeErr(-1, "failed to create ClientWriter") };

    if (auto err = SendChunks(writer, infile, remote_name)) {
        // a server that already answered stops reading; its verdict wins
        writer->WritesDone();
        grpc::Status st = writer->Finish();
        if (st.ok() && !resp.success())
            return { true, std::move(resp), OkError() };

        return { false, filetransfer::TransferResponse{}, st.ok() ? *err : MakeGrpcErr(st) };
    }

    writer->WritesDone();
    grpc::Status st = writer->Finish();
    if (!st.ok())
        return { false, filetransfer::TransferResponse{}, MakeGrpcErr(st) };

    const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
    if (resp.success())
        spdlog::info("sent {} bytes in {:.2f} s ({:.2f} MiB/s)", resp.bytes_received(), seconds,
                     seconds > 0 ? static_cast<double>(resp.bytes_received()) / kMiB / seconds : 0.0);

    return { true, std::move(resp), OkError() };
}

std::optional<FileTransferClient::Error>
FileTransferClient::SendChunks(WriterPtr& writer, const std::filesystem::path& infile, const std::string& remote_name)
{
    std::error_code ec;
    const uintmax_t size = std::filesystem::file_size(infile, ec);
    if (ec)
        return MakeErr(ec.value(), "failed to stat infile: " + ec.message());

    // an empty file still travels as one (empty) chunk
    const int64_t total_chunks = size == 0 ? 1 : static_cast<int64_t>((size + chunk_size_ - 1) / chunk_size_);
    spdlog::info("sending {} ({} bytes) as '{}' in {} chunk(s)", infile.string(), size, remote_name, total_chunks);

    FileStream stream(infile);
    if (const auto &error = stream.Open(std::ios::binary | std::ios::in))
        return MakeErr(-1, "failed to open infile: " + error->message);

    std::vector<char> buffer(chunk_size_);
    uint64_t bytes_sent = 0;

    for (int64_t number = 1; number <= total_chunks; ++number) {
        const auto &[ok, len, err] = stream.Read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (!ok)
            return MakeErr(-1, "failed to read infile: " + err.message);

        if (len <= 0 && size != 0)
            return MakeErr(-1, "infile shrank while it was sent");

        filetransfer::FileChunk chunk;

        chunk.set_filename(remote_name);
        chunk.set_data(buffer.data(), static_cast<size_t>(len));
        chunk.set_chunk_number(number);
        chunk.set_total_chunks(total_chunks);
        chunk.set_is_last_chunk(number == total_chunks);

        if (!writer->Write(chunk))
            return MakeErr(-1, fmt::format("failed to write chunk {}", number));

        bytes_sent += static_cast<uint64_t>(len);

        if (number % kProgressInterval == 0)
            spdlog::info("progress: {:.1f}% ({:.2f} MiB sent)",
                         100.0 * static_cast<double>(bytes_sent) / static_cast<double>(size),
                         static_cast<double>(bytes_sent) / kMiB);
    }

    if (const auto err = stream.Close())
        return MakeErr(err->code, "failed to close infile: " + err->message);

    return std::nullopt;
}

std::tuple<bool, filetransfer::FileInfoResponse, FileTransferClient::Error>
FileTransferClient::GetFileInfo(const std::string& remote_name)
{
    grpc::ClientContext ctx;
    filetransfer::FileInfoRequest req;
    filetransfer::FileInfoResponse resp;

    req.set_filename(remote_name);

    grpc::Status st = stub_->GetFileInfo(&ctx, req, &resp);
    if (!st.ok())
        return { false, filetransfer::FileInfoResponse{}, MakeGrpcErr(st) };

    return { true, std::move(resp), OkError() };
}

std::tuple<bool, bool, FileTransferClient::Error>
FileTransferClient::VerifyFile(const std::string& remote_name, const std::filesystem::path& local_file)
{
    auto [ok, info, err] = GetFileInfo(remote_name);
    if (!ok)
        return { false, false, err };

    if (!info.exists())
        return { true, false, OkError() };

    auto [sum_ok, local_checksum, sum_err] = ComputeChecksum(local_file);
    if (!sum_ok)
        return { false, false, sum_err };

    return { true, local_checksum == info.checksum(), OkError() };
}

std::tuple<bool, std::string, FileTransferClient::Error>
FileTransferClient::ComputeChecksum(const std::filesystem::path& file)
{
    FileStream stream(file);
    if (const auto &error = stream.Open(std::ios::binary | std::ios::in))
        return { false, "", MakeErr(error->code, "failed to open file: " + error->message) };

    ChecksumAccumulator checksum;
    std::vector<char> buffer(64 * 1024);

    while (true) {
        const auto &[ok, len, err] = stream.Read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        if (!ok)
            return { false, "", MakeErr(err.code, "failed to read file: " + err.message) };

        if (len <= 0)
            break;

        if (auto herr = checksum.Update(std::string_view(buffer.data(), static_cast<size_t>(len))))
            return { false, "", MakeErr(herr->code, herr->message) };
    }

    auto [ok, digest, herr] = checksum.Finalize();
    if (!ok)
        return { false, "", MakeErr(herr.code, herr.message) };

    return { true, digest, OkError() };
}
