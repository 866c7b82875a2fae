#include <gtest/gtest.h>

#include <chrono>

#include "TestUtil.hpp"
#include "TransferServiceImpl.hpp"

using namespace std::chrono_literals;

using testutil::FaultyStorage;
using testutil::FakeChunkReader;
using testutil::MakeChunk;
using testutil::ReadFile;
using testutil::SplitIntoChunks;
using testutil::TempDir;
using testutil::WriteFile;

namespace {
	class TransferServiceTest : public ::testing::Test
	{
	protected:
		TransferServiceTest()
			: storage_(dir_.path())
			, registry_(storage_)
			, resolver_(storage_)
			, service_(registry_, resolver_, 0ms) { }

		grpc::Status Run(std::vector<filetransfer::FileChunk> chunks, filetransfer::TransferResponse* response,
				 size_t* reads = nullptr)
		{
			FakeChunkReader reader(std::move(chunks));
			grpc::Status status = service_.ReceiveTransfer(&reader, response, [] { });
			if (reads)
				*reads = reader.GetReadCount();
			return status;
		}

		TempDir dir_;
		FaultyStorage storage_;
		TransferSessionRegistry registry_;
		FileInfoResolver resolver_;
		TransferServiceImpl service_;
	};
}

TEST_F(TransferServiceTest, ValidSequenceSucceeds)
{
	const std::string content = testutil::RandomBytes(4096 * 3 + 17);
	filetransfer::TransferResponse response;

	grpc::Status status = Run(SplitIntoChunks("ok.bin", content, 4096), &response);
	ASSERT_TRUE(status.ok()) << status.error_message();
	EXPECT_TRUE(response.success()) << response.message();
	EXPECT_EQ(response.bytes_received(), static_cast<int64_t>(content.size()));
	EXPECT_EQ(ReadFile(dir_.path() / "ok.bin"), content);
	EXPECT_EQ(registry_.GetActiveCount(), 0u);
}

TEST_F(TransferServiceTest, SingleEmptyChunkCreatesEmptyFile)
{
	filetransfer::TransferResponse response;

	ASSERT_TRUE(Run({ MakeChunk("empty", "", 1, 1, true) }, &response).ok());
	EXPECT_TRUE(response.success());
	EXPECT_EQ(response.bytes_received(), 0);
	EXPECT_TRUE(std::filesystem::exists(dir_.path() / "empty"));
}

TEST_F(TransferServiceTest, OutOfOrderChunkStopsTransfer)
{
	filetransfer::TransferResponse response;
	size_t reads = 0;

	grpc::Status status = Run({
		MakeChunk("f", "aaaa", 1, 4, false),
		MakeChunk("f", "cccc", 3, 4, false),
		MakeChunk("f", "bbbb", 2, 4, false),
		MakeChunk("f", "dddd", 4, 4, true),
	}, &response, &reads);

	ASSERT_TRUE(status.ok());
	EXPECT_FALSE(response.success());
	EXPECT_EQ(response.bytes_received(), 4);
	EXPECT_NE(response.message().find("SequenceMismatch"), std::string::npos);
	EXPECT_EQ(reads, 2u);
	EXPECT_EQ(ReadFile(dir_.path() / "f"), "aaaa");
	EXPECT_EQ(registry_.GetActiveCount(), 0u);
}

TEST_F(TransferServiceTest, PrematureEndReportsPartialBytes)
{
	auto chunks = SplitIntoChunks("five", std::string(50, 'x'), 10);
	chunks.resize(2);
	filetransfer::TransferResponse response;

	ASSERT_TRUE(Run(chunks, &response).ok());
	EXPECT_FALSE(response.success());
	EXPECT_EQ(response.bytes_received(), 20);
	EXPECT_NE(response.message().find("2 of 5"), std::string::npos);
	EXPECT_EQ(registry_.GetActiveCount(), 0u);
	EXPECT_FALSE(registry_.IsBusy("five"));
}

TEST_F(TransferServiceTest, EmptyStream)
{
	filetransfer::TransferResponse response;

	ASSERT_TRUE(Run({}, &response).ok());
	EXPECT_FALSE(response.success());
	EXPECT_EQ(response.bytes_received(), 0);
	EXPECT_NE(response.message().find("before the first chunk"), std::string::npos);
}

TEST_F(TransferServiceTest, InvalidFirstChunkNeverTouchesStorage)
{
	WriteFile(dir_.path() / "keep", "precious");

	for (auto chunk : { MakeChunk("keep", "x", 1, 0, true),
			    MakeChunk("keep", "x", 0, 3, false),
			    MakeChunk("keep", "x", 2, 3, false) }) {
		filetransfer::TransferResponse response;

		ASSERT_TRUE(Run({ chunk }, &response).ok());
		EXPECT_FALSE(response.success());
		EXPECT_EQ(response.bytes_received(), 0);
	}

	EXPECT_EQ(ReadFile(dir_.path() / "keep"), "precious");
}

TEST_F(TransferServiceTest, ZeroTotalIsInvalidTotalChunks)
{
	filetransfer::TransferResponse response;

	ASSERT_TRUE(Run({ MakeChunk("z", "x", 1, 0, true) }, &response).ok());
	EXPECT_NE(response.message().find("InvalidTotalChunks"), std::string::npos);
	EXPECT_FALSE(std::filesystem::exists(dir_.path() / "z"));
}

TEST_F(TransferServiceTest, EmptyFilenameRejected)
{
	filetransfer::TransferResponse response;

	ASSERT_TRUE(Run({ MakeChunk("", "x", 1, 1, true) }, &response).ok());
	EXPECT_FALSE(response.success());
	EXPECT_NE(response.message().find("EmptyFilename"), std::string::npos);
}

TEST_F(TransferServiceTest, FilenameChangeMidStreamRejected)
{
	filetransfer::TransferResponse response;

	ASSERT_TRUE(Run({ MakeChunk("a", "1", 1, 2, false), MakeChunk("b", "2", 2, 2, true) }, &response).ok());
	EXPECT_FALSE(response.success());
	EXPECT_EQ(response.bytes_received(), 1);
	EXPECT_NE(response.message().find("FilenameChanged"), std::string::npos);
}

TEST_F(TransferServiceTest, ChunksAfterLastAreNotRead)
{
	filetransfer::TransferResponse response;
	size_t reads = 0;

	ASSERT_TRUE(Run({ MakeChunk("a", "1", 1, 1, true), MakeChunk("a", "2", 2, 1, false) }, &response, &reads).ok());
	EXPECT_TRUE(response.success());
	EXPECT_EQ(reads, 1u);
}

TEST_F(TransferServiceTest, StorageUnavailableIsTransportError)
{
	storage_.unavailable = true;
	filetransfer::TransferResponse response;

	grpc::Status status = Run(SplitIntoChunks("f", "abc", 10), &response);
	EXPECT_EQ(status.error_code(), grpc::StatusCode::UNAVAILABLE);
	EXPECT_EQ(registry_.GetActiveCount(), 0u);
}

TEST_F(TransferServiceTest, WriteErrorMidTransferIsReportedInResponse)
{
	storage_.appends_before_failure = 2;
	filetransfer::TransferResponse response;

	grpc::Status status = Run(SplitIntoChunks("f", std::string(40, 'w'), 10), &response);
	ASSERT_TRUE(status.ok());
	EXPECT_FALSE(response.success());
	EXPECT_EQ(response.bytes_received(), 20);
	EXPECT_EQ(storage_.GetCloseCount(), 1);
	EXPECT_EQ(registry_.GetActiveCount(), 0u);
}

TEST_F(TransferServiceTest, IdleTimeoutFinalizesAsPrematureEnd)
{
	TransferServiceImpl service(registry_, resolver_, 100ms);
	// chunk 3 never arrives; the watchdog cancels the blocked read
	std::vector<filetransfer::FileChunk> two = SplitIntoChunks("idle", std::string(30, 'i'), 10);
	two.resize(2);
	FakeChunkReader stalled(two, true);

	filetransfer::TransferResponse response;
	const auto start = std::chrono::steady_clock::now();
	grpc::Status status = service.ReceiveTransfer(&stalled, &response, [&stalled] { stalled.Cancel(); });

	ASSERT_TRUE(status.ok());
	EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
	EXPECT_FALSE(response.success());
	EXPECT_EQ(response.bytes_received(), 20);
	EXPECT_EQ(registry_.GetActiveCount(), 0u);
}

TEST_F(TransferServiceTest, SlowStorageIsNotIdleness)
{
	TransferServiceImpl service(registry_, resolver_, 100ms);
	storage_.append_delay = 250ms;
	storage_.close_delay = 250ms;

	const std::string content(30, 's');
	FakeChunkReader reader(SplitIntoChunks("slow", content, 10));

	filetransfer::TransferResponse response;
	grpc::Status status = service.ReceiveTransfer(&reader, &response, [&reader] { reader.Cancel(); });

	ASSERT_TRUE(status.ok()) << status.error_message();
	EXPECT_TRUE(response.success()) << response.message();
	EXPECT_EQ(response.bytes_received(), 30);
	EXPECT_FALSE(reader.IsCancelled());
	EXPECT_EQ(ReadFile(dir_.path() / "slow"), content);
	EXPECT_EQ(registry_.GetActiveCount(), 0u);
}
