#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace occupancyfact::core {

/**
 * @struct IsoWeek
 * @brief ISO-8601 week identity. The week-year can differ from the calendar
 * year for dates near January 1st.
 */
struct IsoWeek {
	int year = 0;
	int week = 0;

	bool operator==(const IsoWeek &other) const {
		return year == other.year && week == other.week;
	}
	bool operator!=(const IsoWeek &other) const {
		return !(*this == other);
	}
	bool operator<(const IsoWeek &other) const {
		return year != other.year ? year < other.year : week < other.week;
	}
};

/**
 * @class CivilDate
 * @brief A proleptic-Gregorian calendar day.
 *
 * Dates are kept as a serial day count relative to 1970-01-01 so that
 * ordering and day arithmetic are integer operations. Year, month and day are
 * cached alongside the serial number.
 */
class CivilDate {
public:
	CivilDate() = default;

	/**
	 * @brief Constructs a date from its calendar fields.
	 * @throws std::invalid_argument If the fields do not name a real day.
	 */
	CivilDate(int year, unsigned month, unsigned day);

	static CivilDate fromSerial(std::int64_t serial);

	/**
	 * @brief Parses "YYYY-MM-DD". A trailing time component separated by a
	 * space or 'T' is accepted and ignored.
	 * @throws std::invalid_argument If the text is not a valid date.
	 */
	static CivilDate parse(const std::string &text);

	/**
	 * @brief Converts a YYYYMMDD integer key back into a date.
	 * @throws std::invalid_argument If the key does not name a real day.
	 */
	static CivilDate fromDateKey(std::int32_t key);

	int year() const {
		return year_;
	}
	unsigned month() const {
		return month_;
	}
	unsigned day() const {
		return day_;
	}
	std::int64_t serial() const {
		return serial_;
	}

	/// YYYYMMDD integer key, e.g. 20250215.
	std::int32_t dateKey() const;

	/// Day of week with Monday = 0 and Sunday = 6.
	int weekday() const;

	bool isWeekday() const {
		return weekday() < 5;
	}
	bool isWeekend() const {
		return !isWeekday();
	}

	unsigned dayOfYear() const;
	IsoWeek isoWeek() const;

	/// Monday of the ISO week containing this date.
	CivilDate weekStart() const;
	CivilDate monthEnd() const;
	CivilDate addDays(std::int64_t days) const;

	std::string toString() const;

	bool operator==(const CivilDate &other) const {
		return serial_ == other.serial_;
	}
	bool operator!=(const CivilDate &other) const {
		return serial_ != other.serial_;
	}
	bool operator<(const CivilDate &other) const {
		return serial_ < other.serial_;
	}
	bool operator<=(const CivilDate &other) const {
		return serial_ <= other.serial_;
	}
	bool operator>(const CivilDate &other) const {
		return serial_ > other.serial_;
	}
	bool operator>=(const CivilDate &other) const {
		return serial_ >= other.serial_;
	}

	static bool isLeapYear(int year);
	static unsigned daysInMonth(int year, unsigned month);

private:
	std::int64_t serial_ = 0;
	int year_ = 1970;
	unsigned month_ = 1;
	unsigned day_ = 1;
};

} // namespace occupancyfact::core

namespace std {
template <>
struct hash<occupancyfact::core::CivilDate> {
	size_t operator()(const occupancyfact::core::CivilDate &date) const noexcept {
		return hash<int64_t>{}(date.serial());
	}
};
} // namespace std
