#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace occupancyfact::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * Every stage of the fact engine logs through the same named logger, which the
 * pipeline application configures once at startup.
 */
class Logging {
public:
	/**
	 * @brief Gets the singleton logger instance.
	 * @return A shared pointer to the spdlog logger.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

	/**
	 * @brief Parses a level name such as "debug" or "warn".
	 * @throws std::invalid_argument If the name is not a known spdlog level.
	 */
	static spdlog::level::level_enum parseLevel(const std::string &name);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace occupancyfact::utils

// --- Logger Macros for convenient access ---
#define OCCUPANCY_TRACE(...)    occupancyfact::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define OCCUPANCY_DEBUG(...)    occupancyfact::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define OCCUPANCY_INFO(...)     occupancyfact::utils::Logging::getLogger()->info(__VA_ARGS__)
#define OCCUPANCY_WARN(...)     occupancyfact::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define OCCUPANCY_ERROR(...)    occupancyfact::utils::Logging::getLogger()->error(__VA_ARGS__)
#define OCCUPANCY_CRITICAL(...) occupancyfact::utils::Logging::getLogger()->critical(__VA_ARGS__)
