#pragma once

#include "occupancy-fact/grid/attendance_aggregator.hpp"
#include "occupancy-fact/grid/grid_expander.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace occupancyfact::grid {

/// What to do with an attendance bucket whose office or line of business is
/// not part of the grid.
enum class UnknownKeyPolicy {
	Error,
	Drop
};

struct FillResult {
	/// Attendance per grid cell, aligned with FactGrid::cells(). Never negative.
	std::vector<std::int64_t> attendance;
	std::size_t matched_buckets = 0;
	std::size_t dropped_buckets = 0;
	std::int64_t dropped_events = 0;
};

/**
 * @brief Left-joins attendance buckets onto the grid, zero-filling every cell
 * without a matching bucket.
 *
 * The bucket grain must match the grid: per-LOB buckets for a per-LOB grid and
 * aggregated buckets otherwise.
 *
 * @throws InconsistentKeyError If a cell would match more than one bucket, if
 * the bucket grain does not match the grid, or (under UnknownKeyPolicy::Error)
 * if a bucket names a date, office or line of business the grid lacks.
 */
FillResult fillAttendance(const FactGrid &grid, const std::vector<AttendanceBucket> &buckets,
                          UnknownKeyPolicy policy = UnknownKeyPolicy::Error);

} // namespace occupancyfact::grid
