#include <gtest/gtest.h>

#include <cerrno>

#include "ChecksumAccumulator.hpp"
#include "FileInfoResolver.hpp"
#include "TestUtil.hpp"

using testutil::FaultyStorage;
using testutil::TempDir;
using testutil::WriteFile;

TEST(FileInfoResolver, MissingFileIsNotAnError)
{
	TempDir dir;
	LocalStorage storage(dir.path());
	FileInfoResolver resolver(storage);

	auto [ok, info, err] = resolver.Resolve("nothing-here");
	ASSERT_TRUE(ok) << err.message;
	EXPECT_FALSE(info.exists());
	EXPECT_EQ(info.file_size(), 0);
	EXPECT_EQ(info.checksum(), "");
}

TEST(FileInfoResolver, UnsafeNameReportsMissing)
{
	TempDir dir;
	LocalStorage storage(dir.path());
	FileInfoResolver resolver(storage);

	auto [ok, info, err] = resolver.Resolve("../etc/passwd");
	ASSERT_TRUE(ok);
	EXPECT_FALSE(info.exists());
}

TEST(FileInfoResolver, ReportsSizeAndChecksum)
{
	TempDir dir;
	LocalStorage storage(dir.path());
	// small read size forces many passes through the accumulator
	FileInfoResolver resolver(storage, 333);
	const std::string content = testutil::RandomBytes(10007);
	WriteFile(dir.path() / "data.bin", content);

	ChecksumAccumulator expected;
	ASSERT_FALSE(expected.Update(content).has_value());

	auto [ok, info, err] = resolver.Resolve("data.bin");
	ASSERT_TRUE(ok) << err.message;
	EXPECT_TRUE(info.exists());
	EXPECT_EQ(info.file_size(), 10007);
	EXPECT_EQ(info.checksum(), std::get<1>(expected.Finalize()));
}

TEST(FileInfoResolver, EmptyFileExists)
{
	TempDir dir;
	LocalStorage storage(dir.path());
	FileInfoResolver resolver(storage);
	WriteFile(dir.path() / "empty", "");

	auto [ok, info, err] = resolver.Resolve("empty");
	ASSERT_TRUE(ok);
	EXPECT_TRUE(info.exists());
	EXPECT_EQ(info.file_size(), 0);
	EXPECT_EQ(info.checksum(), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(FileInfoResolver, UnavailableStorageIsAnError)
{
	TempDir dir;
	FaultyStorage storage(dir.path());
	FileInfoResolver resolver(storage);
	storage.unavailable = true;

	auto [ok, info, err] = resolver.Resolve("whatever");
	EXPECT_FALSE(ok);
	EXPECT_EQ(err.kind, TransferError::Kind::StorageUnavailable);
}

TEST(FileInfoResolver, FileRemovedDuringLookupIsMissing)
{
	TempDir dir;
	FaultyStorage storage(dir.path());
	FileInfoResolver resolver(storage);
	testutil::WriteFile(dir.path() / "gone", "data");
	storage.read_open_errno = ENOENT;

	auto [ok, info, err] = resolver.Resolve("gone");
	ASSERT_TRUE(ok) << err.message;
	EXPECT_FALSE(info.exists());
	EXPECT_EQ(info.file_size(), 0);
	EXPECT_EQ(info.checksum(), "");
}

TEST(FileInfoResolver, UnreadableFileIsInternalNotUnavailable)
{
	TempDir dir;
	FaultyStorage storage(dir.path());
	FileInfoResolver resolver(storage);
	testutil::WriteFile(dir.path() / "locked", "data");
	storage.read_open_errno = EACCES;

	auto [ok, info, err] = resolver.Resolve("locked");
	EXPECT_FALSE(ok);
	EXPECT_EQ(err.kind, TransferError::Kind::Internal);
	EXPECT_EQ(ToStatus(err).error_code(), grpc::StatusCode::INTERNAL);
}
