#include "occupancy-fact/grid/grid_filler.hpp"

#include "occupancy-fact/core/errors.hpp"
#include "occupancy-fact/utils/logging.hpp"

#include <optional>
#include <stdexcept>
#include <string>

namespace occupancyfact::grid {

namespace {

std::string describe(const AttendanceBucketKey &key) {
	std::string text = key.date.toString() + " / '" + key.office_location + "'";
	if (!key.line_of_business.empty()) {
		text += " / '" + key.line_of_business + "'";
	}
	return text;
}

std::optional<std::size_t> locateCell(const FactGrid &grid, const AttendanceBucketKey &key) {
	const auto date_index = grid.dateIndex(key.date);
	const auto location_index = grid.locationIndex(key.office_location);
	if (!date_index || !location_index) {
		return std::nullopt;
	}
	std::size_t lob_index = 0;
	if (grid.byLineOfBusiness()) {
		const auto found = grid.lobIndex(key.line_of_business);
		if (!found) {
			return std::nullopt;
		}
		lob_index = *found;
	}
	return grid.cellIndex(*date_index, *location_index, lob_index);
}

} // namespace

FillResult fillAttendance(const FactGrid &grid, const std::vector<AttendanceBucket> &buckets, UnknownKeyPolicy policy) {
	FillResult result;
	result.attendance.assign(grid.size(), 0);
	std::vector<bool> matched(grid.size(), false);

	for (const auto &bucket : buckets) {
		if (!grid.byLineOfBusiness() && !bucket.key.line_of_business.empty()) {
			throw InconsistentKeyError("per-line-of-business bucket " + describe(bucket.key) +
			                           " supplied to an aggregated grid");
		}
		if (bucket.count < 0) {
			throw std::invalid_argument("Attendance bucket " + describe(bucket.key) + " has a negative count.");
		}

		const auto cell = locateCell(grid, bucket.key);
		if (!cell) {
			if (policy == UnknownKeyPolicy::Error) {
				throw InconsistentKeyError("attendance bucket " + describe(bucket.key) + " has no grid cell");
			}
			++result.dropped_buckets;
			result.dropped_events += bucket.count;
			continue;
		}
		if (matched[*cell]) {
			throw InconsistentKeyError("grid cell " + describe(bucket.key) + " matches more than one attendance bucket");
		}
		matched[*cell] = true;
		result.attendance[*cell] = bucket.count;
		++result.matched_buckets;
	}

	if (result.dropped_buckets > 0) {
		OCCUPANCY_WARN("Dropped {} attendance buckets ({} events) with no matching grid cell", result.dropped_buckets,
		               result.dropped_events);
	}
	OCCUPANCY_INFO("Filled {} grid cells from {} attendance buckets; {} cells zero-filled", grid.size(),
	               result.matched_buckets, grid.size() - result.matched_buckets);
	return result;
}

} // namespace occupancyfact::grid
