#pragma once

#include "occupancy-fact/core/calendar.hpp"
#include "occupancy-fact/facts/fact_table.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace occupancyfact::quality {

/// Per-office figures over weekday rows only.
struct LocationQuality {
	std::string office_location;
	std::size_t rows = 0;
	/// Mean of the non-null weekday occupancy rates.
	std::optional<double> mean_weekday_rate;
	std::size_t unresolved_capacity_rows = 0;
	std::size_t over_capacity_days = 0;
};

/**
 * @struct QualitySummary
 * @brief Data-quality conditions that are expected in real data and therefore
 * reported rather than raised.
 */
struct QualitySummary {
	facts::FactVariant variant = facts::FactVariant::Aggregated;
	std::size_t rows = 0;
	std::optional<core::CivilDate> first_date;
	std::optional<core::CivilDate> last_date;
	std::size_t locations = 0;
	std::size_t lines_of_business = 0;
	/// Rows whose capacity could not be resolved (null capacity and rate).
	std::size_t unresolved_capacity_rows = 0;
	/// Unresolved rows that nevertheless recorded attendance.
	std::size_t attendance_without_capacity_rows = 0;
	/// Rows with occupancy_rate > 1.0.
	std::size_t over_capacity_rows = 0;
	std::size_t hybrid_rows = 0;
	std::optional<double> mean_weekday_rate;
	std::optional<double> mean_weekend_rate;
	/// Ordered by unresolved rows, then over-capacity days (both descending),
	/// then mean weekday rate ascending.
	std::vector<LocationQuality> by_location;
	/// Row indices into the summarized table with occupancy_rate > 1.0.
	std::vector<std::size_t> over_capacity_indices;
};

QualitySummary summarizeQuality(const facts::FactTable &table);

/// Human-readable summary, one line per entry.
std::vector<std::string> summaryLines(const QualitySummary &summary);

} // namespace occupancyfact::quality
