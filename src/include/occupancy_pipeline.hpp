#pragma once

#include "pipeline_config.hpp"
#include "table_io.hpp"

#include "occupancy-fact/facts/fact_builder.hpp"
#include "occupancy-fact/facts/fact_table.hpp"

#include <optional>
#include <string>
#include <vector>

namespace occupancy {

struct PipelineResult {
	std::optional<occupancyfact::facts::FactTable> per_line_of_business;
	std::optional<occupancyfact::facts::FactTable> aggregated;
	std::vector<std::string> written_files;
};

//! Loads the cleaned inputs, builds the configured fact variants and writes them together with the
//! data-quality reports. Nothing is written unless every requested variant builds.
class OccupancyPipeline {
public:
	explicit OccupancyPipeline(PipelineConfig config);

	PipelineResult Run();

	//! Fails with MissingInputError naming every required file that is absent
	void CheckInputsPresent() const;

	occupancyfact::facts::FactInputs LoadInputs(TableIO &io) const;

	const PipelineConfig &Config() const {
		return config_;
	}

private:
	std::vector<std::string> RequiredInputs() const;
	std::vector<std::string> WriteReports(TableIO &io, const occupancyfact::facts::FactInputs &inputs,
	                                      const PipelineResult &result) const;

	PipelineConfig config_;
};

} // namespace occupancy
