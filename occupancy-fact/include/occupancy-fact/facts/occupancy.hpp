#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace occupancyfact::facts {

/**
 * @brief Occupancy rate of a day: attendance divided by capacity.
 * @return The rate, or std::nullopt when capacity is unknown or not positive.
 */
inline std::optional<double> occupancyRate(std::int64_t attendance, const std::optional<std::int64_t> &capacity) {
	if (!capacity || *capacity <= 0) {
		return std::nullopt;
	}
	return static_cast<double>(attendance) / static_cast<double>(*capacity);
}

/**
 * @brief Row-wise occupancyRate() over aligned attendance and capacity columns.
 * @throws std::invalid_argument If the columns differ in length.
 */
std::vector<std::optional<double>> computeOccupancy(const std::vector<std::int64_t> &attendance,
                                                    const std::vector<std::optional<std::int64_t>> &capacity);

} // namespace occupancyfact::facts
