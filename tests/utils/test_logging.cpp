#include <catch2/catch.hpp>

#include "fcast-store/utils/logging.hpp"

#include <spdlog/spdlog.h>

using fcaststore::utils::Logging;

TEST_CASE("Logging initializes singleton logger", "[utils][logging]") {
	auto &logger_ref = Logging::getLogger();
	REQUIRE(logger_ref);
	REQUIRE(logger_ref->name() == "fcast-store");

	const auto first_level = logger_ref->level();

	Logging::init(spdlog::level::debug);
	auto &logger_after_init = Logging::getLogger();

	REQUIRE(logger_ref.get() == logger_after_init.get());
	REQUIRE(logger_after_init->level() == spdlog::level::debug);
	REQUIRE(logger_after_init->flush_level() == spdlog::level::debug);
	REQUIRE(spdlog::get("fcast-store") == logger_after_init);

	// Restore to original level for downstream tests
	logger_after_init->set_level(first_level);
	logger_after_init->flush_on(first_level);
}

TEST_CASE("Logging macros route to the shared logger", "[utils][logging]") {
	REQUIRE_NOTHROW(FCAST_DEBUG("Shaped {} payload into array of shape {}.", "Constant", "[4, 3]"));
	REQUIRE_NOTHROW(FCAST_TRACE("trace {}", 1));
}

TEST_CASE("Level names parse with a fallback", "[utils][logging][config]") {
	REQUIRE(Logging::levelFromName("debug", spdlog::level::info) == spdlog::level::debug);
	REQUIRE(Logging::levelFromName("warning", spdlog::level::info) == spdlog::level::warn);
	REQUIRE(Logging::levelFromName("off", spdlog::level::info) == spdlog::level::off);
	REQUIRE(Logging::levelFromName("", spdlog::level::err) == spdlog::level::err);
	REQUIRE(Logging::levelFromName("loud", spdlog::level::info) == spdlog::level::info);
}
