#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "csv_serializer.h"
#include "pivot_table.h"
#include "text_sink.h"

namespace Stabping {

enum class ExportStatus {
	kOk,           // CSV written
	kEmpty,        // nothing in range; no sink opened
	kOutputError,  // sink could not be opened or a write failed
};

struct ExportResult {
	ExportStatus status = ExportStatus::kOk;
	size_t rows = 0;
	std::string destination;
};

// Opens the output destination. Returns nullptr if it cannot be opened.
using SinkFactory = std::function<std::unique_ptr<TextSink>()>;

/**
 * Runs decode -> pivot -> serialize over an in-memory sample log.
 * The sink is opened through open_sink only after the pivot produced at least
 * one row, and is closed before returning on every path.
 */
ExportResult ExportCsv(const std::vector<uint8_t>& log_bytes,
		const std::vector<std::string>& addresses,
		const TimeRange& range,
		const SinkFactory& open_sink,
		const CsvOptions& options = CsvOptions{});

} // namespace Stabping
