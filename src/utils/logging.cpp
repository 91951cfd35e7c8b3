#include "fcast-store/utils/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>

namespace fcaststore::utils {

std::shared_ptr<spdlog::logger> Logging::logger_;

void Logging::init(spdlog::level::level_enum level) {
	if (!logger_) {
		// Another component may already have registered the logger with spdlog.
		logger_ = spdlog::get(kLoggerName);
		if (!logger_) {
			logger_ = spdlog::stdout_color_mt(kLoggerName);
		}
	}
	logger_->set_level(level);
	logger_->flush_on(level);
}

spdlog::level::level_enum Logging::levelFromName(const std::string &name, spdlog::level::level_enum fallback) {
	if (name.empty()) {
		return fallback;
	}
	const auto level = spdlog::level::from_str(name);
	// from_str maps unknown names to off.
	if (level == spdlog::level::off && name != "off") {
		return fallback;
	}
	return level;
}

std::shared_ptr<spdlog::logger> &Logging::getLogger() {
	if (!logger_) {
		const char *configured = std::getenv(kLevelVariable);
		init(levelFromName(configured == nullptr ? std::string() : std::string(configured), spdlog::level::info));
	}
	return logger_;
}

} // namespace fcaststore::utils
