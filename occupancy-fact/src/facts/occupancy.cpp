#include "occupancy-fact/facts/occupancy.hpp"

#include <stdexcept>

namespace occupancyfact::facts {

std::vector<std::optional<double>> computeOccupancy(const std::vector<std::int64_t> &attendance,
                                                    const std::vector<std::optional<std::int64_t>> &capacity) {
	if (attendance.size() != capacity.size()) {
		throw std::invalid_argument("Attendance and capacity columns must have the same length.");
	}
	std::vector<std::optional<double>> rates;
	rates.reserve(attendance.size());
	for (std::size_t i = 0; i < attendance.size(); ++i) {
		rates.push_back(occupancyRate(attendance[i], capacity[i]));
	}
	return rates;
}

} // namespace occupancyfact::facts
