#pragma once

#include "occupancy-fact/core/calendar.hpp"
#include "occupancy-fact/core/records.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace occupancyfact::grid {

enum class AttendanceGrain {
	ByLineOfBusiness,
	AcrossLinesOfBusiness
};

struct AttendanceBucketKey {
	core::CivilDate date;
	std::string office_location;
	/// Empty when aggregated across lines of business.
	std::string line_of_business;

	bool operator<(const AttendanceBucketKey &other) const;
	bool operator==(const AttendanceBucketKey &other) const;
};

struct AttendanceBucket {
	AttendanceBucketKey key;
	std::int64_t count = 0;
};

/**
 * @brief Counts attendance events per (date, office[, line of business]).
 *
 * Exactly one bucket is produced per observed combination, ordered by key, so
 * the result does not depend on event order. Combinations without events are
 * not materialized.
 */
std::vector<AttendanceBucket> aggregateAttendance(const std::vector<core::AttendanceEvent> &events,
                                                  AttendanceGrain grain);

} // namespace occupancyfact::grid
