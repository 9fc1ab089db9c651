#include "occupancy_pipeline.hpp"
#include "pipeline_config.hpp"

#include "occupancy-fact/core/errors.hpp"
#include "occupancy-fact/utils/logging.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

int main(int argc, char **argv) {
	using occupancyfact::utils::Logging;

	const std::string program = argc > 0 ? argv[0] : "occupancy_pipeline";
	occupancy::PipelineConfig config;
	try {
		const std::vector<std::string> args(argv + (argc > 0 ? 1 : 0), argv + argc);
		config = occupancy::ParsePipelineArguments(args, std::getenv("OCCUPANCY_LOG_LEVEL"));
	} catch (const std::invalid_argument &e) {
		std::cerr << program << ": " << e.what() << "\n\n" << occupancy::PipelineUsage(program);
		return EXIT_FAILURE;
	}
	if (config.show_help) {
		std::cout << occupancy::PipelineUsage(program);
		return EXIT_SUCCESS;
	}

	Logging::init(Logging::parseLevel(config.log_level));

	try {
		occupancy::OccupancyPipeline pipeline(config);
		const auto result = pipeline.Run();
		for (const auto &path : result.written_files) {
			OCCUPANCY_INFO("Wrote {}", path);
		}
	} catch (const occupancyfact::FactError &e) {
		OCCUPANCY_ERROR("Fact build aborted: {}", e.what());
		return 2;
	} catch (const std::exception &e) {
		OCCUPANCY_ERROR("Pipeline failed: {}", e.what());
		return EXIT_FAILURE;
	}
	return EXIT_SUCCESS;
}
