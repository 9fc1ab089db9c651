#pragma once

#include "occupancy-fact/core/calendar.hpp"
#include "occupancy-fact/grid/grid_expander.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace occupancyfact::hybrid {

struct HybridDayOptions {
	/// Anchor days selected per office per ISO week.
	std::size_t anchor_days = 3;
	/// Weekdays a calendar month must contribute to an ISO week for its
	/// weekdays in that week to be eligible.
	std::size_t min_month_weekdays = 3;

	/// @throws std::invalid_argument If either count is zero.
	void validate() const;
};

/// Location-independent eligibility of one calendar date.
struct DateEligibility {
	core::CivilDate date;
	core::IsoWeek week;
	bool is_weekday = false;
	/// Distinct weekday dates the date's month contributes to its ISO week.
	std::size_t month_weekdays_in_week = 0;
	bool eligible = false;
};

/**
 * @brief Evaluates the eligibility predicate over a set of distinct dates.
 *
 * A date is eligible when it is a weekday and its calendar month contributes
 * at least @p min_month_weekdays distinct weekday dates to the date's ISO week.
 * Weekdays are counted within @p dates only, so a week cut short by the
 * covered horizon counts just the days present. The result is aligned with
 * @p dates.
 */
std::vector<DateEligibility> computeDateEligibility(const std::vector<core::CivilDate> &dates,
                                                    std::size_t min_month_weekdays);

/// One selected anchor day of an office in an ISO week.
struct AnchorDay {
	std::size_t location_index = 0;
	core::IsoWeek week;
	std::size_t date_index = 0;
	std::int64_t daily_total = 0;
	/// 1-based position within the week's ranking.
	std::size_t rank = 0;
};

struct HybridDayResult {
	std::vector<AnchorDay> anchors;
	/// Flag per grid cell, aligned with FactGrid::cells().
	std::vector<bool> cell_flags;
	std::size_t flagged_cells = 0;
};

/**
 * @class HybridDayClassifier
 * @brief Selects up to @c anchor_days hybrid anchor days per office per ISO
 * week.
 *
 * Candidates are the eligible dates of the week; they are ranked by the
 * office's daily attendance summed over every line of business, descending,
 * with ties broken by ascending date. Zero-attendance days remain candidates.
 * Every state update is scoped to a single (office, week) pair.
 */
class HybridDayClassifier {
public:
	explicit HybridDayClassifier(HybridDayOptions options = {});

	/**
	 * @brief Classifies every grid cell.
	 * @param attendance Attendance per grid cell, aligned with FactGrid::cells().
	 * @throws std::invalid_argument If @p attendance is not aligned with the grid.
	 */
	HybridDayResult classify(const grid::FactGrid &grid, const std::vector<std::int64_t> &attendance) const;

	/**
	 * @brief Ranks the eligible dates of each (office, week) pair.
	 * @param daily_totals Attendance per (date, location), date-major.
	 */
	std::vector<AnchorDay> selectAnchorDays(const std::vector<DateEligibility> &eligibility,
	                                        std::size_t location_count,
	                                        const std::vector<std::int64_t> &daily_totals) const;

	const HybridDayOptions &options() const {
		return options_;
	}

private:
	HybridDayOptions options_;
};

} // namespace occupancyfact::hybrid
