#include "fcast-store/core/resolution.hpp"

#include "fcast-store/core/errors.hpp"
#include "fcast-store/utils/logging.hpp"

#include <array>
#include <set>
#include <stdexcept>

namespace fcaststore::core {

Period toLargestUnit(Duration difference) {
	static constexpr std::array<Period::Unit, 4> kUnits = {Period::Unit::Day, Period::Unit::Hour,
	                                                        Period::Unit::Minute, Period::Unit::Second};
	const auto millis = difference.count();
	for (const auto unit : kUnits) {
		const auto unit_ms = Period::unitMilliseconds(unit);
		if (millis % unit_ms == 0) {
			return Period{millis / unit_ms, unit};
		}
	}
	throw DataFormatError("cannot understand the resolution of the time series");
}

Period inferResolution(const std::vector<TimePoint> &timestamps) {
	if (timestamps.size() < 2) {
		throw std::invalid_argument("At least two timestamps are required to infer a resolution.");
	}

	std::set<Duration> differences;
	for (std::size_t i = 1; i < timestamps.size(); ++i) {
		differences.insert(elapsed(timestamps[i - 1], timestamps[i]));
	}

	if (differences.size() > 1) {
		FCAST_DEBUG("Found {} distinct timestamp differences while inferring resolution.", differences.size());
		throw DataFormatError("time series has non-uniform resolution: this is currently not supported");
	}

	const auto difference = *differences.begin();
	if (difference <= Duration::zero()) {
		throw DataFormatError("time series timestamps must be strictly increasing");
	}
	return toLargestUnit(difference);
}

TimePoint initialTimestamp(const std::vector<TimePoint> &timestamps) {
	if (timestamps.empty()) {
		throw std::invalid_argument("Cannot take the initial timestamp of an empty sequence.");
	}
	return timestamps.front();
}

Duration totalPeriod(const TimePoint &initial_timestamp, std::size_t count, Duration interval,
                     std::size_t horizon, const Period &resolution) {
	const auto last_initial_time = initial_timestamp + interval * static_cast<std::int64_t>(count);
	const auto steps = horizon == 0 ? 0 : static_cast<std::int64_t>(horizon) - 1;
	const auto last_timestamp = last_initial_time + resolution.duration() * steps;
	return elapsed(initial_timestamp, last_timestamp);
}

} // namespace fcaststore::core
