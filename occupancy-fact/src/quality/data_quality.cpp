#include "occupancy-fact/quality/data_quality.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace occupancyfact::quality {

namespace {

struct RunningMean {
	double sum = 0.0;
	std::size_t count = 0;

	void add(const std::optional<double> &value) {
		if (value) {
			sum += *value;
			++count;
		}
	}

	std::optional<double> value() const {
		if (count == 0) {
			return std::nullopt;
		}
		return sum / static_cast<double>(count);
	}
};

std::string percentOf(std::size_t part, std::size_t whole) {
	if (whole == 0) {
		return "n/a";
	}
	return fmt::format("{:.1f}%", 100.0 * static_cast<double>(part) / static_cast<double>(whole));
}

std::string formatRate(const std::optional<double> &rate) {
	return rate ? fmt::format("{:.3f}", *rate) : std::string("n/a");
}

} // namespace

QualitySummary summarizeQuality(const facts::FactTable &table) {
	QualitySummary summary;
	summary.variant = table.variant;
	summary.rows = table.size();

	RunningMean weekday;
	RunningMean weekend;
	std::set<std::string> all_locations;
	std::set<std::string> lines_of_business;
	std::map<std::string, std::pair<LocationQuality, RunningMean>> locations;

	for (std::size_t i = 0; i < table.rows.size(); ++i) {
		const auto &row = table.rows[i];
		if (!summary.first_date || row.date < *summary.first_date) {
			summary.first_date = row.date;
		}
		if (!summary.last_date || row.date > *summary.last_date) {
			summary.last_date = row.date;
		}
		all_locations.insert(row.location_name);
		if (row.lob_name) {
			lines_of_business.insert(*row.lob_name);
		}

		if (!row.capacity) {
			++summary.unresolved_capacity_rows;
			if (row.attendance_count > 0) {
				++summary.attendance_without_capacity_rows;
			}
		}
		const bool over_capacity = row.occupancy_rate && *row.occupancy_rate > 1.0;
		if (over_capacity) {
			++summary.over_capacity_rows;
			summary.over_capacity_indices.push_back(i);
		}
		if (row.is_hybrid_day) {
			++summary.hybrid_rows;
		}
		if (row.is_weekend) {
			weekend.add(row.occupancy_rate);
			continue;
		}
		weekday.add(row.occupancy_rate);

		auto &location = locations[row.location_name];
		location.first.office_location = row.location_name;
		++location.first.rows;
		location.second.add(row.occupancy_rate);
		if (!row.capacity) {
			++location.first.unresolved_capacity_rows;
		}
		if (over_capacity) {
			++location.first.over_capacity_days;
		}
	}

	summary.locations = all_locations.size();
	summary.lines_of_business = lines_of_business.size();
	summary.mean_weekday_rate = weekday.value();
	summary.mean_weekend_rate = weekend.value();

	summary.by_location.reserve(locations.size());
	for (auto &entry : locations) {
		entry.second.first.mean_weekday_rate = entry.second.second.value();
		summary.by_location.push_back(std::move(entry.second.first));
	}
	std::stable_sort(summary.by_location.begin(), summary.by_location.end(),
	                 [](const LocationQuality &a, const LocationQuality &b) {
		                 if (a.unresolved_capacity_rows != b.unresolved_capacity_rows) {
			                 return a.unresolved_capacity_rows > b.unresolved_capacity_rows;
		                 }
		                 if (a.over_capacity_days != b.over_capacity_days) {
			                 return a.over_capacity_days > b.over_capacity_days;
		                 }
		                 // Locations without any rate sort last.
		                 if (a.mean_weekday_rate.has_value() != b.mean_weekday_rate.has_value()) {
			                 return a.mean_weekday_rate.has_value();
		                 }
		                 return a.mean_weekday_rate.value_or(0.0) < b.mean_weekday_rate.value_or(0.0);
	                 });
	return summary;
}

std::vector<std::string> summaryLines(const QualitySummary &summary) {
	std::vector<std::string> lines;
	lines.push_back(fmt::format("== {} fact ==", facts::factVariantName(summary.variant)));
	lines.push_back(fmt::format("Rows: {}", summary.rows));
	if (summary.first_date && summary.last_date) {
		lines.push_back(
		    fmt::format("Date range: {} to {}", summary.first_date->toString(), summary.last_date->toString()));
	}
	if (summary.lines_of_business > 0) {
		lines.push_back(fmt::format("Locations: {}; lines of business: {}", summary.locations,
		                            summary.lines_of_business));
	} else {
		lines.push_back(fmt::format("Locations: {}", summary.locations));
	}
	lines.push_back(fmt::format("Mean occupancy (weekday): {}; (weekend): {}", formatRate(summary.mean_weekday_rate),
	                            formatRate(summary.mean_weekend_rate)));
	lines.push_back(fmt::format("Rows with unresolved capacity: {} ({})", summary.unresolved_capacity_rows,
	                            percentOf(summary.unresolved_capacity_rows, summary.rows)));
	lines.push_back(fmt::format("Rows with attendance>0 and unresolved capacity: {} ({})",
	                            summary.attendance_without_capacity_rows,
	                            percentOf(summary.attendance_without_capacity_rows, summary.rows)));
	lines.push_back(fmt::format("Rows with occupancy_rate > 1.0: {} ({})", summary.over_capacity_rows,
	                            percentOf(summary.over_capacity_rows, summary.rows)));
	lines.push_back(fmt::format("Hybrid day rows: {} ({})", summary.hybrid_rows,
	                            percentOf(summary.hybrid_rows, summary.rows)));
	return lines;
}

} // namespace occupancyfact::quality
