#include "occupancy-fact/core/records.hpp"

#include <stdexcept>

namespace occupancyfact::core {

std::vector<DateRow> buildDateDimension(const CivilDate &first, const CivilDate &last) {
	if (last < first) {
		throw std::invalid_argument("Date dimension end must not precede its start.");
	}
	std::vector<DateRow> rows;
	rows.reserve(static_cast<std::size_t>(last.serial() - first.serial() + 1));
	for (auto day = first.serial(); day <= last.serial(); ++day) {
		rows.push_back(DateRow::fromDate(CivilDate::fromSerial(day)));
	}
	return rows;
}

} // namespace occupancyfact::core
