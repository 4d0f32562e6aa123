#include "pivot_table.h"

#include <glog/logging.h>

namespace Stabping {

void PivotTable::Set(int32_t timestamp, int32_t address_index, int32_t value) {
	Row& row = rows_[timestamp];
	const bool inserted = row.insert_or_assign(address_index, value).second;
	if (!inserted) {
		overwritten_cells_++;
	}
	columns_.insert(address_index);
}

std::optional<int32_t> PivotTable::Get(int32_t timestamp, int32_t address_index) const {
	auto row_it = rows_.find(timestamp);
	if (row_it == rows_.end()) {
		return std::nullopt;
	}
	auto cell_it = row_it->second.find(address_index);
	if (cell_it == row_it->second.end()) {
		return std::nullopt;
	}
	return cell_it->second;
}

PivotTable BuildPivotTable(const std::vector<Sample>& samples, const TimeRange& range) {
	PivotTable table;
	size_t filtered = 0;
	for (const Sample& s : samples) {
		if (!range.Contains(s.timestamp)) {
			filtered++;
			continue;
		}
		table.Set(s.timestamp, s.address_index, s.value);
	}

	VLOG(1) << "Pivot: " << table.row_count() << " rows, " << table.columns().size()
		<< " columns, " << filtered << " samples outside [" << range.start << ", " << range.end << "]";
	// Last-write-wins hides repeated samples; surface how often it happened.
	if (table.overwritten_cells() > 0) {
		VLOG(1) << "Pivot: " << table.overwritten_cells()
			<< " duplicate (timestamp, address) samples overwritten by later records";
	}
	return table;
}

} // namespace Stabping
