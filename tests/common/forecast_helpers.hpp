#pragma once

#include "fcast-store/core/time_types.hpp"
#include "fcast-store/core/windowed_store.hpp"

#include <chrono>
#include <map>
#include <vector>

namespace tests::helpers {

using fcaststore::core::TimePoint;

/// 2020-01-01T00:00:00 UTC
inline TimePoint epoch2020() {
	return TimePoint{} + std::chrono::seconds{1577836800};
}

inline std::vector<TimePoint> makeTimestamps(std::size_t count, std::chrono::milliseconds step = std::chrono::hours{1},
                                             TimePoint start = epoch2020()) {
	std::vector<TimePoint> timestamps;
	timestamps.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		timestamps.push_back(start + step * static_cast<long long>(i));
	}
	return timestamps;
}

/// Window j holds values base_j, base_j + 1, ... with base_j = 10 * j.
inline std::map<TimePoint, std::vector<double>> makeConstantWindows(std::size_t count, std::size_t horizon,
                                                                    std::chrono::milliseconds interval =
                                                                        std::chrono::hours{1}) {
	std::map<TimePoint, std::vector<double>> windows;
	const auto starts = makeTimestamps(count, interval);
	for (std::size_t j = 0; j < count; ++j) {
		std::vector<double> window;
		for (std::size_t r = 0; r < horizon; ++r) {
			window.push_back(10.0 * static_cast<double>(j) + static_cast<double>(r));
		}
		windows.emplace(starts[j], std::move(window));
	}
	return windows;
}

inline fcaststore::core::ConstantStore makeConstantStore(std::size_t count, std::size_t horizon,
                                                         std::chrono::milliseconds interval = std::chrono::hours{1}) {
	const auto windows = makeConstantWindows(count, horizon, interval);
	return fcaststore::core::ConstantStore(fcaststore::core::ConstantStore::Map(windows.begin(), windows.end()));
}

} // namespace tests::helpers
