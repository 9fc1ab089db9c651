#include <catch2/catch.hpp>

#include "occupancy_pipeline.hpp"
#include "common/scratch_directory.hpp"

#include "occupancy-fact/core/errors.hpp"

#include <filesystem>
#include <sstream>
#include <string>

using namespace occupancy;
using occupancyfact::core::CivilDate;
using test_support::ScratchDirectory;

namespace {

const occupancyfact::facts::FactRow *FindRow(const occupancyfact::facts::FactTable &table, const CivilDate &date,
                                             const std::string &office) {
	for (const auto &row : table.rows) {
		if (row.date == date && row.location_name == office) {
			return &row;
		}
	}
	return nullptr;
}

//! Austin and Boston from 2025-02-10 to 2025-03-16
void WriteSampleInputs(const ScratchDirectory &dir, bool with_date_dimension = true) {
	if (with_date_dimension) {
		std::ostringstream dates;
		dates << "date,date_key,year,month,is_weekend\n";
		for (auto date = CivilDate(2025, 2, 1); date <= CivilDate(2025, 3, 31); date = date.addDays(1)) {
			dates << date.toString() << ',' << date.dateKey() << ',' << date.year() << ',' << date.month() << ','
			      << (date.isWeekend() ? "True" : "False") << '\n';
		}
		dir.Write("data/dimensions/DimDate.csv", dates.str());
	}
	dir.Write("data/dimensions/DimLocation.csv", "location_key,office_location\n1,Austin\n2,Boston\n");
	dir.Write("data/dimensions/DimLineOfBusiness.csv", "lob_key,line_of_business\n1,Corporate\n2,Retail\n");

	std::ostringstream events;
	events << "logon_date,office_location,line_of_business\n";
	events << "2025-02-10,Boston,Retail\n";
	for (int i = 0; i < 50; i++) {
		events << "2025-02-15,Austin,Retail\n";
	}
	for (int i = 0; i < 30; i++) {
		events << "2025-02-15,Austin,Corporate\n";
	}
	for (int i = 0; i < 90; i++) {
		events << "2025-03-14,Austin,Corporate\n";
	}
	for (int i = 0; i < 12; i++) {
		events << "2025-03-12,Boston,Retail\n";
	}
	dir.Write("data/cleaned_data/Occupancy_cleaned.csv", events.str());
	dir.Write("data/cleaned_data/Deskcount_cleaned.csv", "date,office_location,deskcount\n"
	                                                     "2025-01-01,Austin,100\n"
	                                                     "2025-03-01,Austin,120\n"
	                                                     "2025-03-01,Boston,\n"
	                                                     "2025-03-10,Boston,10\n"
	                                                     "2025-03-16,Austin,120\n");
}

PipelineConfig SampleConfig(const ScratchDirectory &dir) {
	PipelineConfig config;
	config.data_root = dir.File("data");
	config.output_root = dir.File("out");
	config.log_level = "warn";
	return config;
}

} // namespace

TEST_CASE("Occupancy Pipeline - builds and writes both facts", "[pipeline]") {
	ScratchDirectory dir("pipeline");
	WriteSampleInputs(dir);

	OccupancyPipeline pipeline(SampleConfig(dir));
	const auto result = pipeline.Run();

	REQUIRE(result.per_line_of_business.has_value());
	REQUIRE(result.aggregated.has_value());

	// 2025-02-10 .. 2025-03-16 is 35 days.
	REQUIRE(result.aggregated->size() == 35 * 2);
	REQUIRE(result.per_line_of_business->size() == 35 * 2 * 2);

	const auto *february = FindRow(*result.aggregated, CivilDate(2025, 2, 15), "Austin");
	REQUIRE(february != nullptr);
	REQUIRE(february->attendance_count == 80);
	REQUIRE(february->capacity == 100);
	REQUIRE(*february->occupancy_rate == Catch::Detail::Approx(0.80));

	const auto *march = FindRow(*result.aggregated, CivilDate(2025, 3, 14), "Austin");
	REQUIRE(march->capacity == 120);
	REQUIRE(*march->occupancy_rate == Catch::Detail::Approx(0.75));
	REQUIRE(march->is_hybrid_day);

	const auto *boston = FindRow(*result.aggregated, CivilDate(2025, 3, 12), "Boston");
	REQUIRE(boston->capacity == 10);
	REQUIRE(*boston->occupancy_rate == Catch::Detail::Approx(1.2));
	REQUIRE_FALSE(FindRow(*result.aggregated, CivilDate(2025, 3, 5), "Boston")->capacity.has_value());

	for (const auto *file : {OutputLayout::LOB_FACT, OutputLayout::AGGREGATED_FACT, OutputLayout::VALIDATION_SUMMARY,
	                         OutputLayout::LOCATION_SUMMARY, OutputLayout::OVER_CAPACITY_DAYS}) {
		REQUIRE(std::filesystem::exists(dir.File(std::string("out/") + file)));
	}
	REQUIRE(result.written_files.size() == 5);

	const auto summary = dir.Read("out/reports/validation_summary.txt");
	REQUIRE(summary.find("== per-line-of-business fact ==") != std::string::npos);
	REQUIRE(summary.find("== aggregated fact ==") != std::string::npos);
	REQUIRE(summary.find("Latest occupancy: 2025-03-14, latest deskcount: 2025-03-16, gap: -2 days") !=
	        std::string::npos);
}

TEST_CASE("Occupancy Pipeline - absent inputs abort before any output", "[pipeline][errors]") {
	ScratchDirectory dir("pipeline_missing");
	WriteSampleInputs(dir);
	std::filesystem::remove(dir.File("data/cleaned_data/Deskcount_cleaned.csv"));

	OccupancyPipeline pipeline(SampleConfig(dir));
	REQUIRE_THROWS_AS(pipeline.Run(), occupancyfact::MissingInputError);
	REQUIRE_FALSE(std::filesystem::exists(dir.File("out")));
}

TEST_CASE("Occupancy Pipeline - line of business dimension is optional for the aggregated fact", "[pipeline]") {
	ScratchDirectory dir("pipeline_aggregated");
	WriteSampleInputs(dir);
	std::filesystem::remove(dir.File("data/dimensions/DimLineOfBusiness.csv"));

	auto config = SampleConfig(dir);
	REQUIRE_THROWS_AS(OccupancyPipeline(config).CheckInputsPresent(), occupancyfact::MissingInputError);

	config.variants = VariantSelection::Aggregated;
	config.write_reports = false;
	const auto result = OccupancyPipeline(config).Run();
	REQUIRE_FALSE(result.per_line_of_business.has_value());
	REQUIRE(result.aggregated.has_value());
	REQUIRE(result.written_files.size() == 1);
	REQUIRE_FALSE(std::filesystem::exists(dir.File("out/reports")));
}

TEST_CASE("Occupancy Pipeline - synthesized date dimension", "[pipeline]") {
	ScratchDirectory dir("pipeline_synthesized");
	WriteSampleInputs(dir, false);

	auto config = SampleConfig(dir);
	config.synthesize_date_dimension = true;
	config.aggregated_horizon_policy = occupancyfact::core::HorizonPolicy::SnapshotMonthEnd;
	OccupancyPipeline pipeline(config);

	TableIO io;
	const auto inputs = pipeline.LoadInputs(io);
	REQUIRE(inputs.dates->front().date == CivilDate(2025, 1, 1));
	REQUIRE(inputs.dates->back().date == CivilDate(2025, 3, 16));

	const auto result = pipeline.Run();
	REQUIRE(result.aggregated->rows.front().date == CivilDate(2025, 2, 10));
	REQUIRE(result.aggregated->rows.back().date == CivilDate(2025, 3, 14));
	REQUIRE(result.per_line_of_business->rows.back().date == CivilDate(2025, 3, 16));
}
