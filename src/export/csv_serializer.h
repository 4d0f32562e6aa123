#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "pivot_table.h"
#include "text_sink.h"

namespace Stabping {

struct CsvOptions {
	char delimiter = ',';
	char quote = '"';
	std::string line_terminator = "\r\n";
};

/**
 * Writes a PivotTable as CSV.
 *
 * Header: timestamp, datetime_utc, then one column per address index in
 * ascending index order, labelled with the address name or unknown_<index>.
 * Rows: ascending timestamp. Latency cells are value/1000 with three decimals;
 * absent cells and sentinel values are written empty.
 */
class CsvSerializer {
public:
	explicit CsvSerializer(std::vector<std::string> addresses, CsvOptions options = CsvOptions{});

	/**
	 * Serialize table into sink
	 * @return Number of data rows written (header excluded)
	 */
	size_t Write(const PivotTable& table, TextSink& sink) const;

	// Address name for a column, or unknown_<index> when the index has no name.
	std::string ColumnLabel(int32_t address_index) const;

	// YYYY-MM-DD HH:MM:SS in UTC.
	static std::string FormatUtc(int64_t timestamp);

	// Milliseconds with three decimals, or "" for a missing or sentinel value.
	static std::string FormatLatency(std::optional<int32_t> value_us);

	// Quotes the field if it contains the delimiter, the quote character or a line break.
	std::string EscapeField(std::string_view field) const;

private:
	void WriteRow(const std::vector<std::string>& fields, TextSink& sink) const;

	std::vector<std::string> addresses_;
	CsvOptions options_;
};

} // namespace Stabping
