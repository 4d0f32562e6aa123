#include "csv_serializer.h"

#include <ctime>
#include <iomanip>
#include <sstream>

#include <glog/logging.h>

#include "common/record_format.h"

namespace Stabping {

CsvSerializer::CsvSerializer(std::vector<std::string> addresses, CsvOptions options)
	: addresses_(std::move(addresses)), options_(std::move(options)) {}

size_t CsvSerializer::Write(const PivotTable& table, TextSink& sink) const {
	const std::vector<int32_t> columns(table.columns().begin(), table.columns().end());

	std::vector<std::string> fields;
	fields.reserve(columns.size() + 2);
	fields.push_back("timestamp");
	fields.push_back("datetime_utc");
	for (int32_t idx : columns) {
		fields.push_back(ColumnLabel(idx));
	}
	WriteRow(fields, sink);

	size_t rows_written = 0;
	for (const auto& [timestamp, row] : table.rows()) {
		fields.clear();
		fields.push_back(std::to_string(timestamp));
		fields.push_back(FormatUtc(timestamp));
		for (int32_t idx : columns) {
			auto cell = row.find(idx);
			fields.push_back(FormatLatency(cell == row.end()
					? std::nullopt : std::optional<int32_t>(cell->second)));
		}
		WriteRow(fields, sink);
		rows_written++;
	}

	VLOG(1) << "Serialized " << rows_written << " rows x " << columns.size() << " address columns";
	return rows_written;
}

std::string CsvSerializer::ColumnLabel(int32_t address_index) const {
	// Negative indices are unresolved too; they never count back from the end of the list.
	if (address_index >= 0 && static_cast<size_t>(address_index) < addresses_.size()) {
		return addresses_[address_index];
	}
	return "unknown_" + std::to_string(address_index);
}

std::string CsvSerializer::FormatUtc(int64_t timestamp) {
	std::time_t tt = static_cast<std::time_t>(timestamp);
	std::tm tm{};
	if (gmtime_r(&tt, &tm) == nullptr) {
		LOG(WARNING) << "Timestamp " << timestamp << " cannot be represented as a UTC date";
		return "";
	}
	std::ostringstream oss;
	oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
	return oss.str();
}

std::string CsvSerializer::FormatLatency(std::optional<int32_t> value_us) {
	if (!value_us.has_value() || record::IsSentinel(*value_us)) {
		return "";
	}
	std::ostringstream oss;
	oss << std::fixed << std::setprecision(3) << (*value_us / 1000.0);
	return oss.str();
}

std::string CsvSerializer::EscapeField(std::string_view field) const {
	const bool needs_quotes = field.find(options_.delimiter) != std::string_view::npos ||
		field.find(options_.quote) != std::string_view::npos ||
		field.find_first_of("\r\n") != std::string_view::npos;
	if (!needs_quotes) {
		return std::string(field);
	}

	std::string out;
	out.reserve(field.size() + 2);
	out.push_back(options_.quote);
	for (char c : field) {
		if (c == options_.quote) {
			out.push_back(options_.quote);
		}
		out.push_back(c);
	}
	out.push_back(options_.quote);
	return out;
}

void CsvSerializer::WriteRow(const std::vector<std::string>& fields, TextSink& sink) const {
	std::string line;
	for (size_t i = 0; i < fields.size(); ++i) {
		if (i > 0) {
			line.push_back(options_.delimiter);
		}
		line += EscapeField(fields[i]);
	}
	line += options_.line_terminator;
	sink.Write(line);
}

} // namespace Stabping
