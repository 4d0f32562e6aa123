#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <vector>

#include "common/record_format.h"
#include "record_decoder.h"

namespace Stabping {

/**
 * Inclusive timestamp window. Defaults cover the whole int32 timestamp domain.
 */
struct TimeRange {
	int64_t start = record::MIN_TIMESTAMP;
	int64_t end = record::MAX_TIMESTAMP;

	bool Contains(int64_t ts) const { return start <= ts && ts <= end; }
};

/**
 * Sparse timestamp x address-index table of raw sample values.
 * Both levels are ordered maps so iteration order is ascending by key.
 */
class PivotTable {
public:
	using Row = std::map<int32_t, int32_t>;  // address_index -> value
	using Rows = std::map<int32_t, Row>;     // timestamp -> row

	// Stores value at (timestamp, address_index); a later call for the same
	// cell replaces the earlier value.
	void Set(int32_t timestamp, int32_t address_index, int32_t value);

	// Value at the cell, or nullopt if no sample landed there.
	std::optional<int32_t> Get(int32_t timestamp, int32_t address_index) const;

	bool empty() const { return rows_.empty(); }
	size_t row_count() const { return rows_.size(); }
	const Rows& rows() const { return rows_; }

	// Distinct address indices present in any row, ascending.
	const std::set<int32_t>& columns() const { return columns_; }

	// Number of Set() calls that replaced an existing cell.
	size_t overwritten_cells() const { return overwritten_cells_; }

private:
	Rows rows_;
	std::set<int32_t> columns_;
	size_t overwritten_cells_ = 0;
};

/**
 * Builds the table from decoded samples, keeping only samples whose timestamp
 * falls inside range. Duplicate (timestamp, address_index) pairs resolve to the
 * sample that came last in decode order.
 * An empty() result means nothing matched; it is not an error.
 */
PivotTable BuildPivotTable(const std::vector<Sample>& samples, const TimeRange& range = TimeRange{});

} // namespace Stabping
