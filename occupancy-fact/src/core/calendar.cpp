#include "occupancy-fact/core/calendar.hpp"

#include <cctype>
#include <cstdio>
#include <stdexcept>

namespace occupancyfact::core {

namespace {

// Serial day of a civil date, 0 == 1970-01-01 (H. Hinnant's days_from_civil).
std::int64_t daysFromCivil(std::int64_t y, unsigned m, unsigned d) {
	y -= m <= 2 ? 1 : 0;
	const std::int64_t era = (y >= 0 ? y : y - 399) / 400;
	const auto yoe = static_cast<std::int64_t>(y - era * 400);
	const auto mp = static_cast<std::int64_t>(m > 2 ? m - 3 : m + 9);
	const std::int64_t doy = (153 * mp + 2) / 5 + static_cast<std::int64_t>(d) - 1;
	const std::int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
	return era * 146097 + doe - 719468;
}

void civilFromDays(std::int64_t z, int &year, unsigned &month, unsigned &day) {
	z += 719468;
	const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
	const std::int64_t doe = z - era * 146097;
	const std::int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
	const std::int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
	const std::int64_t mp = (5 * doy + 2) / 153;
	day = static_cast<unsigned>(doy - (153 * mp + 2) / 5 + 1);
	month = static_cast<unsigned>(mp < 10 ? mp + 3 : mp - 9);
	year = static_cast<int>(yoe + era * 400 + (month <= 2 ? 1 : 0));
}

bool parseDigits(const std::string &text, std::size_t offset, std::size_t count, int &out) {
	if (offset + count > text.size()) {
		return false;
	}
	int value = 0;
	for (std::size_t i = offset; i < offset + count; ++i) {
		if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
			return false;
		}
		value = value * 10 + (text[i] - '0');
	}
	out = value;
	return true;
}

} // namespace

CivilDate::CivilDate(int year, unsigned month, unsigned day) {
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be within [1, 12].");
	}
	if (day < 1 || day > daysInMonth(year, month)) {
		throw std::invalid_argument("Day is out of range for the given month.");
	}
	year_ = year;
	month_ = month;
	day_ = day;
	serial_ = daysFromCivil(year, month, day);
}

CivilDate CivilDate::fromSerial(std::int64_t serial) {
	CivilDate date;
	date.serial_ = serial;
	civilFromDays(serial, date.year_, date.month_, date.day_);
	return date;
}

CivilDate CivilDate::parse(const std::string &text) {
	int year = 0;
	int month = 0;
	int day = 0;
	const bool shape_ok = text.size() >= 10 && text[4] == '-' && text[7] == '-' && parseDigits(text, 0, 4, year) &&
	                      parseDigits(text, 5, 2, month) && parseDigits(text, 8, 2, day);
	if (!shape_ok || (text.size() > 10 && text[10] != ' ' && text[10] != 'T')) {
		throw std::invalid_argument("Expected a date formatted as YYYY-MM-DD, got '" + text + "'.");
	}
	return CivilDate(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

CivilDate CivilDate::fromDateKey(std::int32_t key) {
	if (key <= 0) {
		throw std::invalid_argument("Date key must be a positive YYYYMMDD integer.");
	}
	return CivilDate(key / 10000, static_cast<unsigned>((key / 100) % 100), static_cast<unsigned>(key % 100));
}

std::int32_t CivilDate::dateKey() const {
	return static_cast<std::int32_t>(year_ * 10000 + static_cast<int>(month_) * 100 + static_cast<int>(day_));
}

int CivilDate::weekday() const {
	// 1970-01-01 was a Thursday (index 3).
	const std::int64_t shifted = (serial_ + 3) % 7;
	return static_cast<int>(shifted < 0 ? shifted + 7 : shifted);
}

unsigned CivilDate::dayOfYear() const {
	return static_cast<unsigned>(serial_ - daysFromCivil(year_, 1, 1) + 1);
}

IsoWeek CivilDate::isoWeek() const {
	// The ISO week belongs to the year that contains its Thursday.
	const CivilDate thursday = addDays(3 - weekday());
	IsoWeek week;
	week.year = thursday.year();
	week.week = static_cast<int>((thursday.dayOfYear() - 1) / 7 + 1);
	return week;
}

CivilDate CivilDate::weekStart() const {
	return addDays(-weekday());
}

CivilDate CivilDate::monthEnd() const {
	return CivilDate(year_, month_, daysInMonth(year_, month_));
}

CivilDate CivilDate::addDays(std::int64_t days) const {
	return fromSerial(serial_ + days);
}

std::string CivilDate::toString() const {
	char buffer[16];
	std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", year_, month_, day_);
	return std::string(buffer);
}

bool CivilDate::isLeapYear(int year) {
	return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned CivilDate::daysInMonth(int year, unsigned month) {
	static constexpr unsigned kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
	if (month < 1 || month > 12) {
		throw std::invalid_argument("Month must be within [1, 12].");
	}
	if (month == 2 && isLeapYear(year)) {
		return 29;
	}
	return kDays[month - 1];
}

} // namespace occupancyfact::core
