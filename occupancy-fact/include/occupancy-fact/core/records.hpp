#pragma once

#include "occupancy-fact/core/calendar.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace occupancyfact::core {

/// One calendar day of the date dimension.
struct DateRow {
	CivilDate date;
	std::int32_t date_key = 0;
	int year = 0;
	unsigned month = 0;
	bool is_weekend = false;

	static DateRow fromDate(const CivilDate &date) {
		return DateRow{date, date.dateKey(), date.year(), date.month(), date.isWeekend()};
	}
};

struct LocationRow {
	std::int64_t location_key = 0;
	std::string office_location;
};

struct LineOfBusinessRow {
	std::int64_t lob_key = 0;
	std::string line_of_business;
};

/**
 * @struct AttendanceEvent
 * @brief One observed person-day at an office. Only the grouped count per
 * (date, office[, line of business]) is used by the engine.
 */
struct AttendanceEvent {
	CivilDate date;
	std::string office_location;
	std::string line_of_business;
};

/**
 * @struct CapacitySnapshot
 * @brief Desk capacity of an office, valid from @c effective_date until a
 * later snapshot for the same office supersedes it.
 *
 * A null or non-positive capacity means "no valid capacity", never zero seats.
 */
struct CapacitySnapshot {
	std::string office_location;
	CivilDate effective_date;
	std::optional<std::int64_t> capacity;

	bool isValid() const {
		return capacity.has_value() && *capacity > 0;
	}
};

/**
 * @brief Builds a date dimension with one row per day in [first, last].
 * @throws std::invalid_argument If @p last precedes @p first.
 */
std::vector<DateRow> buildDateDimension(const CivilDate &first, const CivilDate &last);

} // namespace occupancyfact::core
