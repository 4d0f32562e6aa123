#include "record_decoder.h"

#include <glog/logging.h>

#include "common/record_format.h"

namespace Stabping {

DecodeResult DecodeRecords(const uint8_t* data, size_t length) {
	DecodeResult result;
	result.trailing_bytes = record::TrailingBytes(length);
	if (result.trailing_bytes != 0) {
		LOG(WARNING) << "Data file size (" << length << ") is not a multiple of "
			<< record::RECORD_SIZE << "; ignoring " << result.trailing_bytes << " trailing bytes";
	}

	const size_t count = record::WholeRecords(length);
	result.samples.reserve(count);
	for (size_t i = 0; i < count; ++i) {
		const uint8_t* rec = data + i * record::RECORD_SIZE;
		result.samples.push_back(Sample{
			record::LoadLE32(rec + record::TIMESTAMP_OFFSET),
			record::LoadLE32(rec + record::ADDRESS_INDEX_OFFSET),
			record::LoadLE32(rec + record::VALUE_OFFSET)});
	}

	VLOG(1) << "Decoded " << count << " records from " << length << " bytes";
	return result;
}

} // namespace Stabping
