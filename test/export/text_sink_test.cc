#include <gtest/gtest.h>
#include "../../src/export/text_sink.h"
#include "temp_dir.h"

using namespace Stabping;
using Stabping::testing_util::TempDir;

class FdTextSinkTest : public ::testing::Test {
protected:
	TempDir dir_;
};

TEST_F(FdTextSinkTest, WritesFileOnDestruction) {
	const auto path = dir_.path() / "out.csv";
	{
		auto sink = FdTextSink::OpenFile(path.string());
		ASSERT_NE(sink, nullptr);
		sink->Write("a,b\r\n");
		sink->Write("1,2\r\n");
		EXPECT_EQ(sink->Describe(), path.string());
	}
	EXPECT_EQ(TempDir::ReadFile(path), "a,b\r\n1,2\r\n");
}

TEST_F(FdTextSinkTest, SmallBufferFlushesEagerly) {
	const auto path = dir_.path() / "small.csv";
	auto sink = FdTextSink::OpenFile(path.string(), 4);
	ASSERT_NE(sink, nullptr);
	sink->Write("0123456789");
	// Buffer threshold exceeded, so the bytes are already on disk.
	EXPECT_EQ(TempDir::ReadFile(path), "0123456789");
	sink->Write("ab");
	EXPECT_TRUE(sink->Close());
	EXPECT_EQ(TempDir::ReadFile(path), "0123456789ab");
}

TEST_F(FdTextSinkTest, TruncatesExistingFile) {
	const auto path = dir_.path() / "existing.csv";
	TempDir::WriteFile(path, "old contents that are longer");
	{
		auto sink = FdTextSink::OpenFile(path.string());
		ASSERT_NE(sink, nullptr);
		sink->Write("new");
	}
	EXPECT_EQ(TempDir::ReadFile(path), "new");
}

TEST_F(FdTextSinkTest, OpenFailsForMissingDirectory) {
	auto sink = FdTextSink::OpenFile((dir_.path() / "no_such_dir" / "out.csv").string());
	EXPECT_EQ(sink, nullptr);
}

TEST_F(FdTextSinkTest, CloseIsIdempotent) {
	const auto path = dir_.path() / "twice.csv";
	auto sink = FdTextSink::OpenFile(path.string());
	ASSERT_NE(sink, nullptr);
	sink->Write("x");
	EXPECT_TRUE(sink->Close());
	EXPECT_TRUE(sink->Close());
	EXPECT_TRUE(sink->ok());
}

TEST_F(FdTextSinkTest, WriteAfterCloseFails) {
	const auto path = dir_.path() / "closed.csv";
	auto sink = FdTextSink::OpenFile(path.string());
	ASSERT_NE(sink, nullptr);
	ASSERT_TRUE(sink->Close());
	sink->Write("late");
	EXPECT_FALSE(sink->Flush());
	EXPECT_FALSE(sink->ok());
	EXPECT_EQ(TempDir::ReadFile(path), "");
}

TEST(FdTextSinkStdoutTest, DescribesStdout) {
	auto sink = FdTextSink::Stdout();
	ASSERT_NE(sink, nullptr);
	EXPECT_EQ(sink->Describe(), "stdout");
	EXPECT_TRUE(sink->Close());
}

TEST(StringTextSinkTest, Accumulates) {
	StringTextSink sink;
	sink.Write("a");
	sink.Write(std::string_view("bc"));
	EXPECT_TRUE(sink.Flush());
	EXPECT_EQ(sink.str(), "abc");
}
