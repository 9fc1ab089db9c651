#pragma once

#include "occupancy-fact/core/records.hpp"
#include "occupancy-fact/grid/grid_expander.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace occupancyfact::capacity {

/**
 * @class CapacityTimeline
 * @brief Per-office as-of state: unknown until the first valid snapshot, then
 * the most recent valid capacity.
 *
 * The state only moves forward in time. Snapshots without a valid capacity
 * leave the state untouched, so a known capacity is never replaced by
 * "unknown" and never by zero.
 */
class CapacityTimeline {
public:
	/**
	 * @brief Applies a snapshot.
	 * @throws std::invalid_argument If the snapshot is older than one already applied.
	 */
	void apply(const core::CapacitySnapshot &snapshot);

	const std::optional<std::int64_t> &current() const {
		return current_;
	}

	bool isKnown() const {
		return current_.has_value();
	}

	const std::optional<core::CivilDate> &lastEffectiveDate() const {
		return last_effective_;
	}

private:
	std::optional<std::int64_t> current_;
	std::optional<core::CivilDate> last_effective_;
};

struct CapacityResolution {
	/// Capacity per grid cell, aligned with FactGrid::cells(). Null when no
	/// valid snapshot precedes the cell's date.
	std::vector<std::optional<std::int64_t>> capacity;
	std::size_t resolved_cells = 0;
	std::size_t unresolved_cells = 0;
	/// Snapshots whose office is not in the location dimension.
	std::size_t ignored_snapshots = 0;
	/// Snapshots carrying no valid capacity.
	std::size_t invalid_snapshots = 0;
};

/**
 * @brief As-of backward join of capacity snapshots onto the grid.
 *
 * Per office, snapshots are ordered by effective date (stable, so snapshots
 * sharing a date keep their input order and the last one recorded wins) and
 * swept together with the ascending grid dates. Each cell receives the
 * capacity of the latest valid snapshot whose effective date is on or before
 * the cell's date, or null if there is none yet.
 */
CapacityResolution resolveCapacity(const grid::FactGrid &grid, const std::vector<core::CapacitySnapshot> &snapshots);

} // namespace occupancyfact::capacity
