#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace fcaststore::utils {

/**
 * @class Logging
 * @brief Provides a singleton interface to the spdlog logging library.
 *
 * All library components log through the same "fcast-store" logger, which can be
 * configured at startup.
 */
class Logging {
public:
	static constexpr const char *kLoggerName = "fcast-store";
	static constexpr const char *kLevelVariable = "FCAST_STORE_LOG_LEVEL";

	/**
	 * @brief Gets the singleton logger instance.
	 *
	 * The first call initializes the logger at the level named by the
	 * FCAST_STORE_LOG_LEVEL environment variable, or info when it is unset.
	 */
	static std::shared_ptr<spdlog::logger> &getLogger();

	/**
	 * @brief Initializes the logger with a specific logging level.
	 * @param level The minimum level of messages to log.
	 */
	static void init(spdlog::level::level_enum level = spdlog::level::info);

	/**
	 * @brief Parses a level name ("trace", "debug", "info", "warn", "error", "critical", "off").
	 * @return @p fallback for an empty or unknown name.
	 */
	static spdlog::level::level_enum levelFromName(const std::string &name, spdlog::level::level_enum fallback);

private:
	Logging() = default;

	static std::shared_ptr<spdlog::logger> logger_;
};

} // namespace fcaststore::utils

#define FCAST_TRACE(...)    fcaststore::utils::Logging::getLogger()->trace(__VA_ARGS__)
#define FCAST_DEBUG(...)    fcaststore::utils::Logging::getLogger()->debug(__VA_ARGS__)
#define FCAST_INFO(...)     fcaststore::utils::Logging::getLogger()->info(__VA_ARGS__)
#define FCAST_WARN(...)     fcaststore::utils::Logging::getLogger()->warn(__VA_ARGS__)
#define FCAST_ERROR(...)    fcaststore::utils::Logging::getLogger()->error(__VA_ARGS__)
#define FCAST_CRITICAL(...) fcaststore::utils::Logging::getLogger()->critical(__VA_ARGS__)
