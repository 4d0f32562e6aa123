#include "csv_exporter.h"

#include <glog/logging.h>

#include "record_decoder.h"

namespace Stabping {

ExportResult ExportCsv(const std::vector<uint8_t>& log_bytes,
		const std::vector<std::string>& addresses,
		const TimeRange& range,
		const SinkFactory& open_sink,
		const CsvOptions& options) {
	ExportResult result;

	DecodeResult decoded = DecodeRecords(log_bytes);
	PivotTable table = BuildPivotTable(decoded.samples, range);
	if (table.empty()) {
		LOG(WARNING) << "No data found in the specified range.";
		result.status = ExportStatus::kEmpty;
		return result;
	}

	std::unique_ptr<TextSink> sink = open_sink();
	if (!sink) {
		result.status = ExportStatus::kOutputError;
		return result;
	}
	result.destination = sink->Describe();

	CsvSerializer serializer(addresses, options);
	result.rows = serializer.Write(table, *sink);
	if (!sink->Close()) {
		LOG(ERROR) << "Failed to write CSV to " << result.destination;
		result.status = ExportStatus::kOutputError;
		return result;
	}

	LOG(INFO) << "Wrote " << result.rows << " rows to " << result.destination;
	return result;
}

} // namespace Stabping
