#include "occupancy-fact/facts/fact_assembler.hpp"

#include "occupancy-fact/core/errors.hpp"
#include "occupancy-fact/utils/logging.hpp"

#include <algorithm>
#include <string>
#include <tuple>
#include <utility>

namespace occupancyfact::facts {

const char *factVariantName(FactVariant variant) {
	switch (variant) {
	case FactVariant::PerLineOfBusiness:
		return "per-line-of-business";
	case FactVariant::Aggregated:
		return "aggregated";
	}
	return "unknown";
}

namespace {

template <typename Column>
void requireAligned(const Column &column, std::size_t expected, const char *name) {
	if (column.size() != expected) {
		throw InconsistentKeyError(std::string("column '") + name + "' has " + std::to_string(column.size()) +
		                           " values for " + std::to_string(expected) + " grid cells");
	}
}

auto sortKey(const FactRow &row) {
	static const std::string no_lob;
	return std::tie(row.date_key, row.location_name, row.lob_name ? *row.lob_name : no_lob);
}

} // namespace

FactTable assembleFacts(const grid::FactGrid &grid, const DerivedColumns &columns) {
	const std::size_t cell_count = grid.size();
	requireAligned(columns.attendance, cell_count, "attendance_count");
	requireAligned(columns.capacity, cell_count, "capacity");
	requireAligned(columns.occupancy_rate, cell_count, "occupancy_rate");
	requireAligned(columns.is_hybrid_day, cell_count, "is_hybrid_day");

	const std::size_t expected = grid.dates().size() * grid.locations().size() * grid.lobSlots();
	if (cell_count != expected) {
		throw InconsistentKeyError("grid holds " + std::to_string(cell_count) + " cells for a dimension product of " +
		                           std::to_string(expected));
	}

	FactTable table;
	table.variant = grid.byLineOfBusiness() ? FactVariant::PerLineOfBusiness : FactVariant::Aggregated;
	table.rows.reserve(cell_count);

	const auto &cells = grid.cells();
	for (std::size_t i = 0; i < cell_count; ++i) {
		const auto &cell = cells[i];
		const auto &date_row = grid.dates()[cell.date_index];
		const auto &location = grid.locations()[cell.location_index];

		FactRow row;
		row.date_key = date_row.date_key;
		row.location_key = location.location_key;
		row.date = date_row.date;
		row.location_name = location.office_location;
		if (grid.byLineOfBusiness()) {
			const auto &lob = grid.linesOfBusiness()[cell.lob_index];
			row.lob_key = lob.lob_key;
			row.lob_name = lob.line_of_business;
		}
		row.year = date_row.year;
		row.month = date_row.month;
		row.is_weekend = date_row.is_weekend;
		row.attendance_count = columns.attendance[i];
		row.capacity = columns.capacity[i];
		row.occupancy_rate = columns.occupancy_rate[i];
		row.is_hybrid_day = columns.is_hybrid_day[i];
		table.rows.push_back(std::move(row));
	}

	std::stable_sort(table.rows.begin(), table.rows.end(),
	                 [](const FactRow &a, const FactRow &b) { return sortKey(a) < sortKey(b); });
	verifyFactKeys(table);

	OCCUPANCY_INFO("Assembled {} fact with {} rows", factVariantName(table.variant), table.size());
	return table;
}

void verifyFactKeys(const FactTable &table) {
	for (std::size_t i = 1; i < table.rows.size(); ++i) {
		const auto previous = sortKey(table.rows[i - 1]);
		const auto current = sortKey(table.rows[i]);
		if (!(previous < current)) {
			const auto &row = table.rows[i];
			throw InconsistentKeyError("fact key " + row.date.toString() + " / '" + row.location_name + "'" +
			                           (row.lob_name ? " / '" + *row.lob_name + "'" : std::string()) +
			                           (previous == current ? " is duplicated" : " is out of order"));
		}
	}
}

} // namespace occupancyfact::facts
