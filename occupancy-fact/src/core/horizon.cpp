#include "occupancy-fact/core/horizon.hpp"

#include "occupancy-fact/core/errors.hpp"

#include <algorithm>
#include <iterator>
#include <stdexcept>

namespace occupancyfact::core {

Horizon resolveHorizon(const std::vector<AttendanceEvent> &attendance,
                       const std::vector<CapacitySnapshot> &capacity,
                       HorizonPolicy policy) {
	if (attendance.empty()) {
		throw MissingInputError("attendance events");
	}
	if (capacity.empty()) {
		throw MissingInputError("capacity snapshots");
	}

	const auto by_event_date = [](const AttendanceEvent &a, const AttendanceEvent &b) { return a.date < b.date; };
	const auto [first_event, last_event] = std::minmax_element(attendance.begin(), attendance.end(), by_event_date);
	const auto latest_snapshot =
	    std::max_element(capacity.begin(), capacity.end(), [](const CapacitySnapshot &a, const CapacitySnapshot &b) {
		    return a.effective_date < b.effective_date;
	    })->effective_date;

	Horizon horizon;
	horizon.start = first_event->date;
	switch (policy) {
	case HorizonPolicy::SnapshotCutoff:
		horizon.cutoff = latest_snapshot;
		break;
	case HorizonPolicy::SnapshotMonthEnd:
		horizon.cutoff = std::min(last_event->date, latest_snapshot.monthEnd());
		break;
	default:
		throw std::logic_error("Unsupported horizon policy.");
	}

	if (horizon.cutoff < horizon.start) {
		throw std::invalid_argument("Capacity cutoff " + horizon.cutoff.toString() +
		                            " precedes the first attendance event " + horizon.start.toString() + ".");
	}
	return horizon;
}

std::vector<DateRow> restrictToHorizon(const std::vector<DateRow> &dates, const Horizon &horizon) {
	std::vector<DateRow> restricted;
	restricted.reserve(dates.size());
	std::copy_if(dates.begin(), dates.end(), std::back_inserter(restricted),
	             [&](const DateRow &row) { return horizon.contains(row.date); });
	std::sort(restricted.begin(), restricted.end(),
	          [](const DateRow &a, const DateRow &b) { return a.date < b.date; });
	return restricted;
}

} // namespace occupancyfact::core
