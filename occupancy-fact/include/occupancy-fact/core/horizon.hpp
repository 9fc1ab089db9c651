#pragma once

#include "occupancy-fact/core/calendar.hpp"
#include "occupancy-fact/core/records.hpp"

#include <vector>

namespace occupancyfact::core {

/// Inclusive date range [start, cutoff] covered by a fact build.
struct Horizon {
	CivilDate start;
	CivilDate cutoff;

	bool contains(const CivilDate &date) const {
		return start <= date && date <= cutoff;
	}

	std::int64_t days() const {
		return cutoff.serial() - start.serial() + 1;
	}
};

enum class HorizonPolicy {
	/// Earliest attendance event up to the latest capacity snapshot date.
	SnapshotCutoff,
	/// Earliest attendance event up to the latest attendance event, capped at
	/// the end of the month holding the latest capacity snapshot.
	SnapshotMonthEnd
};

/**
 * @brief Derives the covered horizon from the observed inputs.
 * @throws MissingInputError If attendance or capacity data is empty, since
 * neither bound can be determined without them.
 * @throws std::invalid_argument If the derived cutoff precedes the start.
 */
Horizon resolveHorizon(const std::vector<AttendanceEvent> &attendance,
                       const std::vector<CapacitySnapshot> &capacity,
                       HorizonPolicy policy);

/// Keeps the date rows that fall inside @p horizon, ordered by date.
std::vector<DateRow> restrictToHorizon(const std::vector<DateRow> &dates, const Horizon &horizon);

} // namespace occupancyfact::core
