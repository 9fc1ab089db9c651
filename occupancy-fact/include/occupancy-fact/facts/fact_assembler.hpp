#pragma once

#include "occupancy-fact/facts/fact_table.hpp"
#include "occupancy-fact/grid/grid_expander.hpp"

#include <cstdint>
#include <optional>
#include <vector>

namespace occupancyfact::facts {

/// Derived columns, each aligned with FactGrid::cells().
struct DerivedColumns {
	std::vector<std::int64_t> attendance;
	std::vector<std::optional<std::int64_t>> capacity;
	std::vector<std::optional<double>> occupancy_rate;
	std::vector<bool> is_hybrid_day;
};

/**
 * @brief Joins the derived columns onto the grid and orders the rows by
 * (date_key, location name[, line of business name]).
 *
 * @throws InconsistentKeyError If a column is not aligned with the grid or the
 * assembled rows are not in one-to-one correspondence with the grid.
 */
FactTable assembleFacts(const grid::FactGrid &grid, const DerivedColumns &columns);

/**
 * @brief Checks that @p table holds exactly one row per key and that its rows
 * appear in output order.
 * @throws InconsistentKeyError On a duplicate or out-of-order key.
 */
void verifyFactKeys(const FactTable &table);

} // namespace occupancyfact::facts
