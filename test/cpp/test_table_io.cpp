#include <catch2/catch.hpp>

#include "table_io.hpp"
#include "common/scratch_directory.hpp"

#include "occupancy-fact/core/errors.hpp"
#include "occupancy-fact/quality/data_quality.hpp"

#include <string>

using occupancy::TableIO;
using occupancyfact::core::CivilDate;
using test_support::ScratchDirectory;

TEST_CASE("Table IO - reads dimensions", "[io][dimensions]") {
	ScratchDirectory dir("dimensions");
	const auto dates = dir.Write("DimDate.csv", "date,date_key,year,month,is_weekend\n"
	                                            "2025-01-03,20250103,2025,1,False\n"
	                                            "2025-01-04,20250104,2025,1,True\n");
	const auto locations = dir.Write("DimLocation.csv", "location_key,office_location\n"
	                                                    "1,Austin\n"
	                                                    "2,New York\n");
	const auto lobs = dir.Write("DimLineOfBusiness.csv", "lob_key,line_of_business\n"
	                                                     "7,Retail\n");

	TableIO io;
	const auto date_rows = io.ReadDateDimension(dates);
	REQUIRE(date_rows.size() == 2);
	REQUIRE(date_rows[0].date == CivilDate(2025, 1, 3));
	REQUIRE(date_rows[0].date_key == 20250103);
	REQUIRE_FALSE(date_rows[0].is_weekend);
	REQUIRE(date_rows[1].is_weekend);

	const auto location_rows = io.ReadLocationDimension(locations);
	REQUIRE(location_rows.size() == 2);
	REQUIRE(location_rows[1].location_key == 2);
	REQUIRE(location_rows[1].office_location == "New York");

	const auto lob_rows = io.ReadLineOfBusinessDimension(lobs);
	REQUIRE(lob_rows.size() == 1);
	REQUIRE(lob_rows[0].lob_key == 7);
	REQUIRE(lob_rows[0].line_of_business == "Retail");
}

TEST_CASE("Table IO - date keys must match their dates", "[io][dimensions]") {
	ScratchDirectory dir("bad_dates");
	const auto dates = dir.Write("DimDate.csv", "date,date_key,year,month,is_weekend\n"
	                                            "2025-01-03,20250104,2025,1,False\n");
	TableIO io;
	REQUIRE_THROWS_AS(io.ReadDateDimension(dates), occupancyfact::InconsistentKeyError);
}

TEST_CASE("Table IO - reads attendance and capacity", "[io][inputs]") {
	ScratchDirectory dir("inputs");
	const auto attendance = dir.Write("Occupancy_cleaned.csv", "logon_date,office_location,line_of_business\n"
	                                                           "2025-01-06 08:15:00,Austin,Retail\n"
	                                                           "2025-01-06,Austin,\n"
	                                                           ",Austin,Retail\n");
	const auto capacity = dir.Write("Deskcount_cleaned.csv", "date,office_location,deskcount\n"
	                                                         "2025-01-01,Austin,120.0\n"
	                                                         "2025-02-01,Austin,\n"
	                                                         "2025-03-01,Austin,95\n");

	TableIO io;
	const auto events = io.ReadAttendance(attendance);
	REQUIRE(events.size() == 2);
	REQUIRE(events[0].date == CivilDate(2025, 1, 6));
	REQUIRE(events[0].office_location == "Austin");
	REQUIRE(events[0].line_of_business == "Retail");
	REQUIRE(events[1].line_of_business.empty());

	const auto snapshots = io.ReadCapacity(capacity);
	REQUIRE(snapshots.size() == 3);
	REQUIRE(snapshots[0].capacity == 120);
	REQUIRE_FALSE(snapshots[1].capacity.has_value());
	REQUIRE(snapshots[2].effective_date == CivilDate(2025, 3, 1));
	REQUIRE(snapshots[2].capacity == 95);
}

TEST_CASE("Table IO - missing files are missing inputs", "[io][errors]") {
	ScratchDirectory dir("missing");
	TableIO io;
	try {
		io.ReadCapacity(dir.File("Deskcount_cleaned.csv"));
		FAIL("expected a missing input failure");
	} catch (const occupancyfact::MissingInputError &e) {
		REQUIRE(e.kind() == occupancyfact::ErrorKind::MissingInput);
		REQUIRE(std::string(e.what()).find("Deskcount_cleaned.csv") != std::string::npos);
	}
}

TEST_CASE("Table IO - writes fact tables with empty nulls", "[io][facts]") {
	ScratchDirectory dir("facts");
	occupancyfact::facts::FactTable table;
	table.variant = occupancyfact::facts::FactVariant::PerLineOfBusiness;

	occupancyfact::facts::FactRow row;
	row.date = CivilDate(2025, 1, 6);
	row.date_key = row.date.dateKey();
	row.location_key = 1;
	row.location_name = "Austin";
	row.lob_key = 3;
	row.lob_name = std::string("Retail");
	row.year = 2025;
	row.month = 1;
	row.attendance_count = 4;
	row.is_hybrid_day = true;
	table.rows.push_back(row);

	row.date = CivilDate(2025, 1, 7);
	row.date_key = row.date.dateKey();
	row.capacity = 8;
	row.occupancy_rate = 0.5;
	row.is_hybrid_day = false;
	table.rows.push_back(row);

	TableIO io;
	io.WriteFactTable(table, dir.File("facts/FactOccupancy.csv"));

	const auto text = dir.Read("facts/FactOccupancy.csv");
	REQUIRE(text.rfind("date_key,location_key,lob_key,date,office_location,line_of_business,year,month,is_weekend,"
	                   "attendance_count,deskcount,occupancy_rate,is_hybrid_day\n",
	                   0) == 0);
	REQUIRE(text.find("20250106,1,3,2025-01-06,Austin,Retail,2025,1,false,4,,,true\n") != std::string::npos);
	REQUIRE(text.find("20250107,1,3,2025-01-07,Austin,Retail,2025,1,false,4,8,0.5,false\n") != std::string::npos);
}

TEST_CASE("Table IO - writes quality reports", "[io][quality]") {
	ScratchDirectory dir("reports");
	occupancyfact::facts::FactTable table;
	occupancyfact::facts::FactRow row;
	row.date = CivilDate(2025, 1, 6);
	row.date_key = row.date.dateKey();
	row.location_key = 1;
	row.location_name = "Austin";
	row.attendance_count = 12;
	row.capacity = 10;
	row.occupancy_rate = 1.2;
	table.rows.push_back(row);

	const auto summary = occupancyfact::quality::summarizeQuality(table);
	TableIO io;
	io.WriteLocationSummary(summary, dir.File("reports/by_location_summary.csv"));
	io.WriteOverCapacityDays(table, summary, dir.File("reports/over_capacity_days.csv"));

	const auto locations = dir.Read("reports/by_location_summary.csv");
	REQUIRE(locations.rfind("office_location,rows,mean_occupancy_rate,unresolved_capacity_rows,over_capacity_days\n",
	                        0) == 0);
	REQUIRE(locations.find("Austin,1,1.2,0,1\n") != std::string::npos);

	const auto over_capacity = dir.Read("reports/over_capacity_days.csv");
	REQUIRE(over_capacity.rfind("date,office_location,attendance_count,deskcount,occupancy_rate\n", 0) == 0);
	REQUIRE(over_capacity.find("2025-01-06,Austin,12,10,1.2\n") != std::string::npos);
}

TEST_CASE("Table IO - quotes SQL literals", "[io]") {
	REQUIRE(TableIO::QuoteLiteral("plain.csv") == "'plain.csv'");
	REQUIRE(TableIO::QuoteLiteral("o'brien.csv") == "'o''brien.csv'");
}
