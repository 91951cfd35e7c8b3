#include "fcast-store/core/single_time_series.hpp"

#include "fcast-store/core/errors.hpp"
#include "fcast-store/utils/logging.hpp"

#include <cstddef>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace fcaststore::core {

namespace {

void requireValues(const WindowData &data, const std::string &name) {
	if (windowLength(data) == 0) {
		throw std::invalid_argument("SingleTimeSeries '" + name + "' must hold at least one value.");
	}
}

} // namespace

SingleTimeSeries::SingleTimeSeries(std::string name, TimePoint initial_timestamp, Period resolution,
                                   const WindowData &data, const SeriesBuildOptions &options)
    : ForecastSeries(std::move(name), resolution, PayloadId::generate(), options.scaling_factor_multiplier,
                     options.features),
      initial_timestamp_(initial_timestamp), data_(options.normalization_factor.apply(data)) {
	requireValues(data_, this->name());
	FCAST_DEBUG("Built SingleTimeSeries '{}' with {} {} values starting at {}.", this->name(), horizon(),
	            toString(payloadKind()), formatTimestamp(initial_timestamp_));
}

SingleTimeSeries::SingleTimeSeries(std::string name, TimePoint initial_timestamp, Period resolution,
                                   PayloadId payload_id, std::optional<std::string> scaling_factor_multiplier,
                                   Features features, WindowData data)
    : ForecastSeries(std::move(name), resolution, payload_id, std::move(scaling_factor_multiplier),
                     std::move(features)),
      initial_timestamp_(initial_timestamp), data_(std::move(data)) {
	requireValues(data_, this->name());
}

SingleTimeSeries::SingleTimeSeries(const SingleTimeSeries &source, WindowData data)
    : ForecastSeries(source), initial_timestamp_(source.initial_timestamp_), data_(std::move(data)) {
	requireValues(data_, name());
	renewPayloadId();
}

SingleTimeSeries SingleTimeSeries::fromTimeArray(std::string name, const TimeArray &array,
                                                 const SeriesBuildOptions &options) {
	if (array.columnCount() > 1) {
		throw std::invalid_argument("TimeArray for SingleTimeSeries '" + name + "' has more than one column.");
	}
	const auto resolution = array.resolution();
	return SingleTimeSeries(std::move(name), array.timestamps().front(), resolution, WindowData(array.values()),
	                        options);
}

SingleTimeSeries SingleTimeSeries::fromMetadata(const SeriesMetadata &metadata, WindowData data) {
	if (metadata.kind != SeriesKind::SingleTimeSeries) {
		throw std::invalid_argument("Metadata of '" + metadata.name + "' describes a " + toString(metadata.kind) +
		                            " series, not a SingleTimeSeries.");
	}
	SingleTimeSeries series(metadata.name, metadata.initial_timestamp, metadata.resolution, metadata.payload_id,
	                        metadata.scaling_factor_multiplier, metadata.features, std::move(data));
	series.requireRecordedGeometry(metadata);
	return series;
}

WindowData SingleTimeSeries::getWindow(const TimePoint &start_time, std::optional<std::size_t> len) const {
	if (start_time != initial_timestamp_) {
		throw std::invalid_argument("Timestamp " + formatTimestamp(start_time) + " is not the start of '" + name() +
		                            "'.");
	}
	if (!len || *len >= horizon()) {
		return data_;
	}
	return std::visit(
	    [&len](const auto &values) {
		    using Window = std::decay_t<decltype(values)>;
		    return WindowData(Window(values.begin(), values.begin() + static_cast<std::ptrdiff_t>(*len)));
	    },
	    data_);
}

std::vector<TimePoint> SingleTimeSeries::timestamps() const {
	std::vector<TimePoint> result;
	result.reserve(horizon());
	for (std::size_t i = 0; i < horizon(); ++i) {
		result.push_back(initial_timestamp_ + resolution() * static_cast<std::int64_t>(i));
	}
	return result;
}

SingleTimeSeries SingleTimeSeries::subset(const TimePoint &start, std::size_t length) const {
	const auto offset = elapsed(initial_timestamp_, start);
	const auto step = resolution().duration();
	if (offset < Duration::zero() || offset % step != Duration::zero()) {
		throw std::invalid_argument("Timestamp " + formatTimestamp(start) + " is not a timestep of '" + name() +
		                            "'.");
	}
	const auto first = static_cast<std::size_t>(offset / step);
	if (length == 0 || first >= horizon() || length > horizon() - first) {
		throw std::invalid_argument("Requested range of " + std::to_string(length) + " values at " +
		                            formatTimestamp(start) + " exceeds '" + name() + "'.");
	}

	auto sliced = std::visit(
	    [first, length](const auto &values) {
		    using Window = std::decay_t<decltype(values)>;
		    return WindowData(Window(values.begin() + static_cast<std::ptrdiff_t>(first),
		                             values.begin() + static_cast<std::ptrdiff_t>(first + length)));
	    },
	    data_);
	SingleTimeSeries result(*this, std::move(sliced));
	result.initial_timestamp_ = start;
	return result;
}

TimeArray SingleTimeSeries::toTimeArray() const {
	const auto *values = std::get_if<std::vector<double>>(&data_);
	if (values == nullptr) {
		throw NotImplementedError("toTimeArray", toString(payloadKind()) + " payloads");
	}
	return TimeArray(timestamps(), *values);
}

DenseArray SingleTimeSeries::shapeForStorage() const {
	return core::shapeForStorage(data_);
}

} // namespace fcaststore::core
