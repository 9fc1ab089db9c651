#include "occupancy-fact/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace occupancyfact::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		logger_ = spdlog::get("occupancy-fact");
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt("occupancy-fact");
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		// Initialize with default level if not already done.
		init();
	}
	return logger_;
}

spdlog::level::level_enum Logging::parseLevel(const std::string &name) {
	std::string lowered = name;
	std::transform(lowered.begin(), lowered.end(), lowered.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	if (lowered == "warning") {
		lowered = "warn";
	}
	const auto level = spdlog::level::from_str(lowered);
	// from_str falls back to "off" for unknown names.
	if (level == spdlog::level::off && lowered != "off") {
		throw std::invalid_argument("Unknown log level '" + name + "'.");
	}
	return level;
}

} // namespace occupancyfact::utils
