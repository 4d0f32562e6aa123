#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace Stabping {

/**
 * One probe sample as stored in the tcpping log.
 * value is a latency in microseconds or one of the record:: sentinels.
 */
struct Sample {
	int32_t timestamp;
	int32_t address_index;
	int32_t value;
};

struct DecodeResult {
	std::vector<Sample> samples;  // on-disk order
	size_t trailing_bytes = 0;    // bytes after the last whole record
};

/**
 * Interprets a byte buffer as consecutive 12-byte little-endian records.
 * Only whole records are decoded. A buffer whose length is not a multiple of
 * the record size is logged as a warning and the usable prefix is returned.
 * No range checks are applied to any field.
 */
DecodeResult DecodeRecords(const uint8_t* data, size_t length);

inline DecodeResult DecodeRecords(const std::vector<uint8_t>& buffer) {
	return DecodeRecords(buffer.data(), buffer.size());
}

inline DecodeResult DecodeRecords(const std::string& buffer) {
	return DecodeRecords(reinterpret_cast<const uint8_t*>(buffer.data()), buffer.size());
}

} // namespace Stabping
