#include "occupancy-fact/grid/attendance_aggregator.hpp"

#include "occupancy-fact/utils/logging.hpp"

#include <map>
#include <tuple>

namespace occupancyfact::grid {

bool AttendanceBucketKey::operator<(const AttendanceBucketKey &other) const {
	return std::tie(date, office_location, line_of_business) <
	       std::tie(other.date, other.office_location, other.line_of_business);
}

bool AttendanceBucketKey::operator==(const AttendanceBucketKey &other) const {
	return date == other.date && office_location == other.office_location &&
	       line_of_business == other.line_of_business;
}

std::vector<AttendanceBucket> aggregateAttendance(const std::vector<core::AttendanceEvent> &events,
                                                  AttendanceGrain grain) {
	std::map<AttendanceBucketKey, std::int64_t> counts;
	for (const auto &event : events) {
		AttendanceBucketKey key{event.date, event.office_location,
		                        grain == AttendanceGrain::ByLineOfBusiness ? event.line_of_business : std::string()};
		++counts[std::move(key)];
	}

	std::vector<AttendanceBucket> buckets;
	buckets.reserve(counts.size());
	for (auto &entry : counts) {
		buckets.push_back(AttendanceBucket{entry.first, entry.second});
	}
	OCCUPANCY_INFO("Aggregated {} attendance events into {} buckets", events.size(), buckets.size());
	return buckets;
}

} // namespace occupancyfact::grid
