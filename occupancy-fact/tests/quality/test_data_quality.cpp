#include <catch2/catch.hpp>

#include "occupancy-fact/quality/data_quality.hpp"
#include "common/fact_fixtures.hpp"

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>

using occupancyfact::facts::FactRow;
using occupancyfact::facts::FactTable;
using occupancyfact::facts::FactVariant;
using occupancyfact::quality::summarizeQuality;
using occupancyfact::quality::summaryLines;
using tests::helpers::day;

namespace {

FactRow makeRow(const std::string &date, const std::string &office, std::int64_t attendance,
                std::optional<std::int64_t> capacity) {
	FactRow row;
	row.date = day(date);
	row.date_key = row.date.dateKey();
	row.location_name = office;
	row.year = row.date.year();
	row.month = row.date.month();
	row.is_weekend = row.date.isWeekend();
	row.attendance_count = attendance;
	row.capacity = capacity;
	if (capacity && *capacity > 0) {
		row.occupancy_rate = static_cast<double>(attendance) / static_cast<double>(*capacity);
	}
	return row;
}

FactTable sampleTable() {
	FactTable table;
	table.variant = FactVariant::Aggregated;
	table.rows.push_back(makeRow("2025-01-06", "Austin", 50, 100));
	table.rows.push_back(makeRow("2025-01-06", "Boston", 3, std::nullopt));
	table.rows.push_back(makeRow("2025-01-07", "Austin", 110, 100));
	table.rows.push_back(makeRow("2025-01-07", "Boston", 0, std::nullopt));
	table.rows.push_back(makeRow("2025-01-11", "Austin", 10, 100));
	table.rows.push_back(makeRow("2025-01-11", "Denver", 5, 10));
	table.rows[0].is_hybrid_day = true;
	table.rows[2].is_hybrid_day = true;
	return table;
}

} // namespace

TEST_CASE("Quality summary counts data conditions", "[quality][summary]") {
	const auto summary = summarizeQuality(sampleTable());

	REQUIRE(summary.variant == FactVariant::Aggregated);
	REQUIRE(summary.rows == 6);
	REQUIRE(summary.first_date == day("2025-01-06"));
	REQUIRE(summary.last_date == day("2025-01-11"));
	REQUIRE(summary.locations == 3);
	REQUIRE(summary.lines_of_business == 0);
	REQUIRE(summary.unresolved_capacity_rows == 2);
	REQUIRE(summary.attendance_without_capacity_rows == 1);
	REQUIRE(summary.over_capacity_rows == 1);
	REQUIRE(summary.over_capacity_indices.size() == 1);
	REQUIRE(summary.over_capacity_indices.front() == 2);
	REQUIRE(summary.hybrid_rows == 2);

	REQUIRE(*summary.mean_weekday_rate == Catch::Detail::Approx(0.80));
	REQUIRE(*summary.mean_weekend_rate == Catch::Detail::Approx(0.30));
}

TEST_CASE("Quality summary ranks locations by their problems", "[quality][summary]") {
	const auto summary = summarizeQuality(sampleTable());

	// Denver only appears on a weekend.
	REQUIRE(summary.by_location.size() == 2);
	REQUIRE(summary.by_location[0].office_location == "Boston");
	REQUIRE(summary.by_location[0].unresolved_capacity_rows == 2);
	REQUIRE_FALSE(summary.by_location[0].mean_weekday_rate.has_value());

	REQUIRE(summary.by_location[1].office_location == "Austin");
	REQUIRE(summary.by_location[1].rows == 2);
	REQUIRE(summary.by_location[1].over_capacity_days == 1);
	REQUIRE(*summary.by_location[1].mean_weekday_rate == Catch::Detail::Approx(0.80));
}

TEST_CASE("Quality summary renders readable lines", "[quality][report]") {
	const auto lines = summaryLines(summarizeQuality(sampleTable()));
	REQUIRE_FALSE(lines.empty());
	REQUIRE(lines.front() == "== aggregated fact ==");
	REQUIRE(std::find(lines.begin(), lines.end(), "Rows: 6") != lines.end());
	REQUIRE(std::find(lines.begin(), lines.end(), "Date range: 2025-01-06 to 2025-01-11") != lines.end());
	REQUIRE(std::find(lines.begin(), lines.end(), "Rows with occupancy_rate > 1.0: 1 (16.7%)") != lines.end());
}

TEST_CASE("Quality summary of an empty table", "[quality][summary]") {
	FactTable table;
	table.variant = FactVariant::PerLineOfBusiness;
	const auto summary = summarizeQuality(table);
	REQUIRE(summary.rows == 0);
	REQUIRE_FALSE(summary.first_date.has_value());
	REQUIRE_FALSE(summary.mean_weekday_rate.has_value());
	REQUIRE(summary.by_location.empty());

	const auto lines = summaryLines(summary);
	REQUIRE(lines.front() == "== per-line-of-business fact ==");
	REQUIRE(std::find(lines.begin(), lines.end(), "Rows with unresolved capacity: 0 (n/a)") != lines.end());
}
