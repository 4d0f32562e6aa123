#include <gtest/gtest.h>
#include "../../src/export/record_decoder.h"
#include "../../src/common/record_format.h"
#include "test_records.h"

using namespace Stabping;
using Stabping::testing_util::EncodeLog;

TEST(RecordDecoderTest, EmptyBuffer) {
	DecodeResult r = DecodeRecords(std::vector<uint8_t>{});
	EXPECT_TRUE(r.samples.empty());
	EXPECT_EQ(r.trailing_bytes, 0u);
}

TEST(RecordDecoderTest, DecodesLittleEndianFields) {
	// 0x12345678, 7, -1
	std::vector<uint8_t> buf = {
		0x78, 0x56, 0x34, 0x12,
		0x07, 0x00, 0x00, 0x00,
		0xff, 0xff, 0xff, 0xff,
	};
	DecodeResult r = DecodeRecords(buf);
	ASSERT_EQ(r.samples.size(), 1u);
	EXPECT_EQ(r.samples[0].timestamp, 0x12345678);
	EXPECT_EQ(r.samples[0].address_index, 7);
	EXPECT_EQ(r.samples[0].value, -1);
	EXPECT_EQ(r.trailing_bytes, 0u);
}

TEST(RecordDecoderTest, PreservesOnDiskOrder) {
	auto buf = EncodeLog({{3000, 1, 10}, {1000, 0, 20}, {2000, 2, 30}});
	DecodeResult r = DecodeRecords(buf);
	ASSERT_EQ(r.samples.size(), 3u);
	EXPECT_EQ(r.samples[0].timestamp, 3000);
	EXPECT_EQ(r.samples[1].timestamp, 1000);
	EXPECT_EQ(r.samples[2].timestamp, 2000);
	EXPECT_EQ(r.samples[2].address_index, 2);
	EXPECT_EQ(r.samples[2].value, 30);
}

TEST(RecordDecoderTest, SentinelsPassThroughUnchanged) {
	auto buf = EncodeLog({{1, 0, record::SENTINEL_ERROR}, {1, 1, record::SENTINEL_NODATA}});
	DecodeResult r = DecodeRecords(buf);
	ASSERT_EQ(r.samples.size(), 2u);
	EXPECT_EQ(r.samples[0].value, -2100000000);
	EXPECT_EQ(r.samples[1].value, -2000000000);
}

TEST(RecordDecoderTest, TruncatedTailIsDropped) {
	auto buf = EncodeLog({{1000, 0, 5000}, {2000, 1, 6000}});
	for (size_t extra = 1; extra < record::RECORD_SIZE; ++extra) {
		std::vector<uint8_t> truncated(buf.begin(), buf.end());
		truncated.insert(truncated.end(), extra, 0xab);
		DecodeResult r = DecodeRecords(truncated);
		ASSERT_EQ(r.samples.size(), 2u) << "extra=" << extra;
		EXPECT_EQ(r.trailing_bytes, extra);
		EXPECT_EQ(r.samples[1].value, 6000);
	}
}

TEST(RecordDecoderTest, ShorterThanOneRecord) {
	std::vector<uint8_t> buf(11, 0);
	DecodeResult r = DecodeRecords(buf);
	EXPECT_TRUE(r.samples.empty());
	EXPECT_EQ(r.trailing_bytes, 11u);
}

TEST(RecordDecoderTest, OutOfRangeIndexIsNotRejected) {
	auto buf = EncodeLog({{-5, -3, 100}, {2147483647, 1000000, 0}});
	DecodeResult r = DecodeRecords(buf);
	ASSERT_EQ(r.samples.size(), 2u);
	EXPECT_EQ(r.samples[0].timestamp, -5);
	EXPECT_EQ(r.samples[0].address_index, -3);
	EXPECT_EQ(r.samples[1].timestamp, 2147483647);
	EXPECT_EQ(r.samples[1].address_index, 1000000);
}

TEST(RecordDecoderTest, StringOverloadMatchesByteOverload) {
	auto buf = EncodeLog({{42, 3, 9999}});
	std::string as_string(buf.begin(), buf.end());
	DecodeResult r = DecodeRecords(as_string);
	ASSERT_EQ(r.samples.size(), 1u);
	EXPECT_EQ(r.samples[0].timestamp, 42);
	EXPECT_EQ(r.samples[0].address_index, 3);
	EXPECT_EQ(r.samples[0].value, 9999);
}
