#include "fcast-store/core/forecast_series.hpp"

#include "fcast-store/core/resolution.hpp"
#include "fcast-store/core/windowed_store.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace fcaststore::core {

ForecastSeries::ForecastSeries(std::string name, Period resolution, PayloadId payload_id,
                               std::optional<std::string> scaling_factor_multiplier, Features features)
    : name_(std::move(name)), resolution_(resolution), payload_id_(payload_id),
      scaling_factor_multiplier_(std::move(scaling_factor_multiplier)), features_(std::move(features)) {
	if (name_.empty()) {
		throw std::invalid_argument("Series name must not be empty.");
	}
	if (resolution_.count <= 0) {
		throw std::invalid_argument("Series resolution must be positive, got " + resolution_.toString() + ".");
	}
}

std::vector<TimePoint> ForecastSeries::initialTimes() const {
	if (count() == 0) {
		return {};
	}
	return core::initialTimes(initialTimestamp(), count(), interval());
}

Duration ForecastSeries::totalPeriod() const {
	if (count() == 0) {
		return Duration::zero();
	}
	return core::totalPeriod(initialTimestamp(), count(), interval(), horizon(), resolution_);
}

SeriesMetadata ForecastSeries::metadata() const {
	SeriesMetadata meta;
	meta.name = name_;
	meta.kind = kind();
	meta.resolution = resolution_;
	meta.initial_timestamp = count() == 0 ? TimePoint{} : initialTimestamp();
	meta.interval = interval();
	meta.count = count();
	meta.horizon = horizon();
	meta.payload_id = payload_id_;
	meta.scaling_factor_multiplier = scaling_factor_multiplier_;
	meta.features = features_;
	return meta;
}

void ForecastSeries::requireRecordedGeometry(const SeriesMetadata &metadata) const {
	if (count() != metadata.count || horizon() != metadata.horizon) {
		throw std::invalid_argument("Payload " + payload_id_.toString() + " of '" + name_ + "' holds " +
		                            std::to_string(count()) + " windows of horizon " + std::to_string(horizon()) +
		                            ", metadata records " + std::to_string(metadata.count) + " of horizon " +
		                            std::to_string(metadata.horizon) + ".");
	}
}

} // namespace fcaststore::core
