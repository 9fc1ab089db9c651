#include "occupancy-fact/hybrid/hybrid_day_classifier.hpp"

#include "occupancy-fact/utils/logging.hpp"

#include <algorithm>
#include <map>
#include <stdexcept>
#include <tuple>
#include <unordered_set>

namespace occupancyfact::hybrid {

void HybridDayOptions::validate() const {
	if (anchor_days == 0) {
		throw std::invalid_argument("Anchor day count must be positive.");
	}
	if (min_month_weekdays == 0) {
		throw std::invalid_argument("Minimum month weekdays per week must be positive.");
	}
}

std::vector<DateEligibility> computeDateEligibility(const std::vector<core::CivilDate> &dates,
                                                    std::size_t min_month_weekdays) {
	using MonthInWeek = std::tuple<int, int, int, unsigned>;

	std::map<MonthInWeek, std::size_t> weekday_counts;
	std::unordered_set<core::CivilDate> seen;
	for (const auto &date : dates) {
		if (!seen.insert(date).second) {
			throw std::invalid_argument("Eligibility requires distinct dates; " + date.toString() + " repeats.");
		}
		if (!date.isWeekday()) {
			continue;
		}
		const auto week = date.isoWeek();
		++weekday_counts[MonthInWeek{week.year, week.week, date.year(), date.month()}];
	}

	std::vector<DateEligibility> result;
	result.reserve(dates.size());
	for (const auto &date : dates) {
		DateEligibility entry;
		entry.date = date;
		entry.week = date.isoWeek();
		entry.is_weekday = date.isWeekday();
		const auto it = weekday_counts.find(MonthInWeek{entry.week.year, entry.week.week, date.year(), date.month()});
		entry.month_weekdays_in_week = it == weekday_counts.end() ? 0 : it->second;
		entry.eligible = entry.is_weekday && entry.month_weekdays_in_week >= min_month_weekdays;
		result.push_back(entry);
	}
	return result;
}

HybridDayClassifier::HybridDayClassifier(HybridDayOptions options) : options_(options) {
	options_.validate();
}

std::vector<AnchorDay> HybridDayClassifier::selectAnchorDays(const std::vector<DateEligibility> &eligibility,
                                                             std::size_t location_count,
                                                             const std::vector<std::int64_t> &daily_totals) const {
	if (daily_totals.size() != eligibility.size() * location_count) {
		throw std::invalid_argument("Daily totals must cover every (date, location) pair.");
	}

	struct Candidate {
		std::int64_t total;
		std::size_t date_index;
	};

	std::vector<AnchorDay> anchors;
	for (std::size_t l = 0; l < location_count; ++l) {
		std::map<core::IsoWeek, std::vector<Candidate>> weeks;
		for (std::size_t d = 0; d < eligibility.size(); ++d) {
			if (!eligibility[d].eligible) {
				continue;
			}
			weeks[eligibility[d].week].push_back(Candidate{daily_totals[d * location_count + l], d});
		}

		for (auto &entry : weeks) {
			auto &candidates = entry.second;
			std::sort(candidates.begin(), candidates.end(), [&](const Candidate &a, const Candidate &b) {
				if (a.total != b.total) {
					return a.total > b.total;
				}
				return eligibility[a.date_index].date < eligibility[b.date_index].date;
			});
			const std::size_t take = std::min(options_.anchor_days, candidates.size());
			for (std::size_t rank = 0; rank < take; ++rank) {
				anchors.push_back(AnchorDay{l, entry.first, candidates[rank].date_index, candidates[rank].total, rank + 1});
			}
		}
	}
	return anchors;
}

HybridDayResult HybridDayClassifier::classify(const grid::FactGrid &grid,
                                              const std::vector<std::int64_t> &attendance) const {
	if (attendance.size() != grid.size()) {
		throw std::invalid_argument("Attendance must be aligned with the grid cells.");
	}

	const auto &dates = grid.dates();
	const std::size_t location_count = grid.locations().size();

	std::vector<core::CivilDate> calendar;
	calendar.reserve(dates.size());
	for (const auto &row : dates) {
		calendar.push_back(row.date);
	}
	const auto eligibility = computeDateEligibility(calendar, options_.min_month_weekdays);

	// The hybrid flag is a per-day attribute, so ranking always uses the
	// office's total across lines of business.
	std::vector<std::int64_t> daily_totals(dates.size() * location_count, 0);
	const auto &cells = grid.cells();
	for (std::size_t i = 0; i < cells.size(); ++i) {
		daily_totals[cells[i].date_index * location_count + cells[i].location_index] += attendance[i];
	}

	HybridDayResult result;
	result.anchors = selectAnchorDays(eligibility, location_count, daily_totals);

	std::vector<bool> selected(dates.size() * location_count, false);
	for (const auto &anchor : result.anchors) {
		selected[anchor.date_index * location_count + anchor.location_index] = true;
	}

	result.cell_flags.assign(cells.size(), false);
	for (std::size_t i = 0; i < cells.size(); ++i) {
		const auto key = cells[i].date_index * location_count + cells[i].location_index;
		// Guard against any selection that slipped past the eligibility filter.
		const bool flagged = selected[key] && eligibility[cells[i].date_index].eligible;
		result.cell_flags[i] = flagged;
		if (flagged) {
			++result.flagged_cells;
		}
	}

	const auto eligible_dates =
	    std::count_if(eligibility.begin(), eligibility.end(), [](const DateEligibility &e) { return e.eligible; });
	OCCUPANCY_INFO("Hybrid days: {} of {} dates eligible, {} anchor days selected, {} of {} cells flagged",
	               eligible_dates, eligibility.size(), result.anchors.size(), result.flagged_cells, cells.size());
	return result;
}

} // namespace occupancyfact::hybrid
