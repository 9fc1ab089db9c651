#pragma once

#include "occupancy-fact/core/calendar.hpp"
#include "occupancy-fact/core/horizon.hpp"
#include "occupancy-fact/facts/fact_builder.hpp"
#include "occupancy-fact/facts/fact_table.hpp"
#include "occupancy-fact/grid/grid_filler.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace occupancy {

enum class VariantSelection {
	Both,
	PerLineOfBusiness,
	Aggregated
};

// Input files, relative to the data root.
struct InputLayout {
	static constexpr const char *DATE_DIMENSION = "dimensions/DimDate.csv";
	static constexpr const char *LOCATION_DIMENSION = "dimensions/DimLocation.csv";
	static constexpr const char *LOB_DIMENSION = "dimensions/DimLineOfBusiness.csv";
	static constexpr const char *ATTENDANCE = "cleaned_data/Occupancy_cleaned.csv";
	static constexpr const char *CAPACITY = "cleaned_data/Deskcount_cleaned.csv";
};

// Output files, relative to the output root.
struct OutputLayout {
	static constexpr const char *LOB_FACT = "facts/FactOccupancy.csv";
	static constexpr const char *AGGREGATED_FACT = "facts/FactOccupancyAggregated.csv";
	static constexpr const char *VALIDATION_SUMMARY = "reports/validation_summary.txt";
	static constexpr const char *LOCATION_SUMMARY = "reports/by_location_summary.csv";
	static constexpr const char *OVER_CAPACITY_DAYS = "reports/over_capacity_days.csv";
};

struct PipelineConfig {
	std::string data_root = ".";
	std::string output_root = ".";
	VariantSelection variants = VariantSelection::Both;
	occupancyfact::core::HorizonPolicy lob_horizon_policy = occupancyfact::core::HorizonPolicy::SnapshotCutoff;
	occupancyfact::core::HorizonPolicy aggregated_horizon_policy = occupancyfact::core::HorizonPolicy::SnapshotCutoff;
	std::optional<occupancyfact::core::CivilDate> start;
	std::optional<occupancyfact::core::CivilDate> cutoff;
	occupancyfact::grid::UnknownKeyPolicy unknown_keys = occupancyfact::grid::UnknownKeyPolicy::Error;
	std::size_t anchor_days = 3;
	std::size_t min_month_weekdays = 3;
	bool synthesize_date_dimension = false;
	bool write_reports = true;
	std::string log_level = "info";
	bool show_help = false;

	bool Builds(occupancyfact::facts::FactVariant variant) const;

	//! Engine options for one fact variant
	occupancyfact::facts::FactBuildOptions BuildOptions(occupancyfact::facts::FactVariant variant) const;

	std::string InputPath(const char *relative) const;
	std::string OutputPath(const char *relative) const;

	//! Throws std::invalid_argument on inconsistent settings
	void Validate() const;
};

//! Parses command-line arguments (without the program name).
//! env_log_level is the value of OCCUPANCY_LOG_LEVEL, or nullptr when unset; --log-level overrides it.
PipelineConfig ParsePipelineArguments(const std::vector<std::string> &args, const char *env_log_level = nullptr);

std::string PipelineUsage(const std::string &program);

occupancyfact::core::HorizonPolicy ParseHorizonPolicy(const std::string &name);
const char *HorizonPolicyName(occupancyfact::core::HorizonPolicy policy);

} // namespace occupancy
