#include <catch2/catch.hpp>

#include "occupancy-fact/core/errors.hpp"
#include "occupancy-fact/grid/attendance_aggregator.hpp"
#include "occupancy-fact/grid/grid_expander.hpp"
#include "occupancy-fact/grid/grid_filler.hpp"
#include "common/fact_fixtures.hpp"

#include <numeric>
#include <vector>

using occupancyfact::core::AttendanceEvent;
using occupancyfact::grid::AttendanceBucket;
using occupancyfact::grid::AttendanceGrain;
using occupancyfact::grid::UnknownKeyPolicy;
using occupancyfact::grid::aggregateAttendance;
using occupancyfact::grid::expandGrid;
using occupancyfact::grid::fillAttendance;
using tests::helpers::day;

TEST_CASE("Grid filler zero-fills combinations without attendance", "[grid][filler]") {
	const auto grid = expandGrid(tests::helpers::dateRange("2025-01-06", "2025-01-12"),
	                             tests::helpers::makeLocations({"Austin", "Boston"}),
	                             tests::helpers::makeLinesOfBusiness({"Corporate", "Retail"}));
	std::vector<AttendanceEvent> events;
	tests::helpers::addEvents(events, "2025-01-06", "Austin", "Retail", 3);
	tests::helpers::addEvents(events, "2025-01-08", "Boston", "Corporate", 2);

	const auto result = fillAttendance(grid, aggregateAttendance(events, AttendanceGrain::ByLineOfBusiness));
	REQUIRE(result.attendance.size() == grid.size());
	REQUIRE(result.matched_buckets == 2);
	REQUIRE(result.dropped_buckets == 0);
	REQUIRE(std::accumulate(result.attendance.begin(), result.attendance.end(), std::int64_t{0}) == 5);

	const auto austin_retail = grid.cellIndex(*grid.dateIndex(day("2025-01-06")), *grid.locationIndex("Austin"),
	                                          *grid.lobIndex("Retail"));
	REQUIRE(result.attendance[austin_retail] == 3);
	const auto austin_corporate = grid.cellIndex(*grid.dateIndex(day("2025-01-06")), *grid.locationIndex("Austin"),
	                                             *grid.lobIndex("Corporate"));
	REQUIRE(result.attendance[austin_corporate] == 0);
	for (auto count : result.attendance) {
		REQUIRE(count >= 0);
	}
}

TEST_CASE("Grid filler reports attendance outside the dimensions", "[grid][filler][error]") {
	const auto grid = expandGrid(tests::helpers::dateRange("2025-01-06", "2025-01-12"),
	                             tests::helpers::makeLocations({"Austin"}));
	std::vector<AttendanceEvent> events;
	tests::helpers::addEvents(events, "2025-01-06", "Austin", "Retail", 1);
	tests::helpers::addEvents(events, "2025-01-07", "Chicago", "Retail", 4);
	const auto buckets = aggregateAttendance(events, AttendanceGrain::AcrossLinesOfBusiness);

	REQUIRE_THROWS_AS(fillAttendance(grid, buckets), occupancyfact::InconsistentKeyError);

	const auto dropped = fillAttendance(grid, buckets, UnknownKeyPolicy::Drop);
	REQUIRE(dropped.matched_buckets == 1);
	REQUIRE(dropped.dropped_buckets == 1);
	REQUIRE(dropped.dropped_events == 4);
}

TEST_CASE("Grid filler rejects buckets matching the same cell twice", "[grid][filler][error]") {
	const auto grid = expandGrid(tests::helpers::dateRange("2025-01-06", "2025-01-12"),
	                             tests::helpers::makeLocations({"Austin"}));
	std::vector<AttendanceBucket> buckets(2);
	buckets[0].key = {day("2025-01-06"), "Austin", ""};
	buckets[0].count = 2;
	buckets[1] = buckets[0];
	REQUIRE_THROWS_AS(fillAttendance(grid, buckets), occupancyfact::InconsistentKeyError);
}

TEST_CASE("Grid filler rejects per-LOB buckets on an aggregated grid", "[grid][filler][error]") {
	const auto grid = expandGrid(tests::helpers::dateRange("2025-01-06", "2025-01-12"),
	                             tests::helpers::makeLocations({"Austin"}));
	std::vector<AttendanceEvent> events;
	tests::helpers::addEvents(events, "2025-01-06", "Austin", "Retail", 1);
	REQUIRE_THROWS_AS(fillAttendance(grid, aggregateAttendance(events, AttendanceGrain::ByLineOfBusiness)),
	                  occupancyfact::InconsistentKeyError);
}
