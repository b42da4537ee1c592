#pragma once

#include <spdlog/spdlog.h>
#include <memory>

namespace almanac::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * Every module of the engine logs through the same logger so that a caller can
 * raise or silence the verbosity of a whole analysis run in one place.
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

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace almanac::utils

// --- Logger Macros for convenient access ---
#define ALMANAC_TRACE(...)    almanac::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define ALMANAC_DEBUG(...)    almanac::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define ALMANAC_INFO(...)     almanac::utils::Logging::getLogger()->info(__VA_ARGS__)
#define ALMANAC_WARN(...)     almanac::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define ALMANAC_ERROR(...)    almanac::utils::Logging::getLogger()->error(__VA_ARGS__)
#define ALMANAC_CRITICAL(...) almanac::utils::Logging::getLogger()->critical(__VA_ARGS__)
