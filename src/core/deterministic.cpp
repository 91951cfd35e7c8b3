#include "fcast-store/core/deterministic.hpp"

#include "fcast-store/core/errors.hpp"
#include "fcast-store/io/raw_series_reader.hpp"
#include "fcast-store/utils/logging.hpp"

#include <stdexcept>
#include <utility>

namespace fcaststore::core {

// --- Deterministic ---

Deterministic::Deterministic(std::string name, const SeriesData &data, Period resolution,
                             const SeriesBuildOptions &options)
    : ForecastSeries(std::move(name), resolution, PayloadId::generate(), options.scaling_factor_multiplier,
                     options.features),
      data_(options.normalization_factor.apply(data)) {
	FCAST_DEBUG("Built Deterministic '{}' with {} windows of horizon {} ({} payload).", this->name(), count(),
	            horizon(), toString(payloadKind()));
}

Deterministic::Deterministic(std::string name, Period resolution, PayloadId payload_id,
                             std::optional<std::string> scaling_factor_multiplier, Features features,
                             SeriesData data)
    : ForecastSeries(std::move(name), resolution, payload_id, std::move(scaling_factor_multiplier),
                     std::move(features)),
      data_(std::move(data)) {
}

Deterministic::Deterministic(const Deterministic &source, SeriesData data)
    : ForecastSeries(source), data_(std::move(data)) {
	renewPayloadId();
}

Deterministic Deterministic::fromRaw(std::string name, const RawTimeSeries &raw, Period resolution,
                                     const SeriesBuildOptions &options) {
	return Deterministic(std::move(name), classifyPayload(raw, options.payload_inference), resolution, options);
}

Deterministic Deterministic::fromValues(std::string name, const std::map<TimePoint, std::vector<double>> &values,
                                        Period resolution, const SeriesBuildOptions &options) {
	return Deterministic(std::move(name), SeriesData(ConstantStore(ConstantStore::Map(values.begin(), values.end()))),
	                     resolution, options);
}

Deterministic Deterministic::fromTimeArrays(std::string name, const std::map<TimePoint, TimeArray> &windows,
                                            const SeriesBuildOptions &options) {
	if (windows.empty()) {
		throw std::invalid_argument("At least one TimeArray is required to build a Deterministic forecast.");
	}

	ConstantStore::Map data;
	for (const auto &entry : windows) {
		if (entry.second.columnCount() > 1) {
			throw std::invalid_argument("TimeArray with timestamp " + formatTimestamp(entry.first) +
			                            " has more than one column.");
		}
		data.emplace(entry.first, entry.second.columnCount() == 0 ? std::vector<double>{} : entry.second.values());
	}
	const auto resolution = windows.begin()->second.resolution();
	return Deterministic(std::move(name), SeriesData(ConstantStore(std::move(data))), resolution, options);
}

Deterministic Deterministic::fromFile(std::string name, const std::string &source, const std::string &owner_name,
                                      Period resolution, io::IRawSeriesReader &reader,
                                      const SeriesBuildOptions &options) {
	FCAST_DEBUG("Reading Deterministic '{}' for '{}' from {}.", name, owner_name, source);
	const auto raw = reader.read(SeriesKind::Deterministic, source, owner_name);
	return fromRaw(std::move(name), raw, resolution, options);
}

Deterministic Deterministic::fromMetadata(const SeriesMetadata &metadata, SeriesData data) {
	if (metadata.kind != SeriesKind::Deterministic) {
		throw std::invalid_argument("Metadata of '" + metadata.name + "' describes a " + toString(metadata.kind) +
		                            " series, not a Deterministic one.");
	}
	Deterministic series(metadata.name, metadata.resolution, metadata.payload_id, metadata.scaling_factor_multiplier,
	                     metadata.features, std::move(data));
	series.requireRecordedGeometry(metadata);
	return series;
}

Deterministic Deterministic::subset(const std::vector<TimePoint> &start_times) const {
	auto selected = std::visit([&start_times](const auto &store) { return SeriesData(store.subset(start_times)); },
	                           data_);
	return Deterministic(*this, std::move(selected));
}

std::size_t Deterministic::count() const {
	return std::visit([](const auto &store) { return store.count(); }, data_);
}

std::size_t Deterministic::horizon() const {
	return std::visit([](const auto &store) { return store.horizon(); }, data_);
}

Duration Deterministic::interval() const {
	return std::visit([](const auto &store) { return store.interval(); }, data_);
}

TimePoint Deterministic::initialTimestamp() const {
	return std::visit([](const auto &store) { return store.initialTimestamp(); }, data_);
}

WindowData Deterministic::getWindow(const TimePoint &start_time, std::optional<std::size_t> len) const {
	return std::visit([&](const auto &store) { return WindowData(store.window(start_time, len)); }, data_);
}

TimeArray Deterministic::makeTimeArray() const {
	// Only the single-window constant case is supported.
	if (count() != 1) {
		throw NotImplementedError("makeTimeArray", "forecasts with " + std::to_string(count()) + " windows");
	}
	if (payloadKind() != PayloadKind::Constant) {
		throw NotImplementedError("makeTimeArray", toString(payloadKind()) + " payloads");
	}
	const auto &constant = store<double>();
	const auto &values = constant.begin()->second;

	std::vector<TimePoint> timestamps;
	timestamps.reserve(values.size());
	const auto start = constant.initialTimestamp();
	for (std::size_t i = 0; i < values.size(); ++i) {
		timestamps.push_back(start + resolution() * static_cast<std::int64_t>(i));
	}
	return TimeArray(std::move(timestamps), values);
}

DenseArray Deterministic::shapeForStorage() const {
	return core::shapeForStorage(data_);
}

// --- Builder Implementation ---

DeterministicBuilder &DeterministicBuilder::withName(std::string name) {
	name_ = std::move(name);
	return *this;
}

DeterministicBuilder &DeterministicBuilder::withResolution(Period resolution) {
	resolution_ = resolution;
	return *this;
}

DeterministicBuilder &DeterministicBuilder::withNormalizationFactor(NormalizationFactor factor) {
	options_.normalization_factor = std::move(factor);
	return *this;
}

DeterministicBuilder &DeterministicBuilder::withScalingFactorMultiplier(std::string multiplier) {
	options_.scaling_factor_multiplier = std::move(multiplier);
	return *this;
}

DeterministicBuilder &DeterministicBuilder::withFeature(std::string key, std::string value) {
	options_.features[std::move(key)] = std::move(value);
	return *this;
}

DeterministicBuilder &DeterministicBuilder::withPayloadInference(PayloadInference inference) {
	options_.payload_inference = inference;
	return *this;
}

Period DeterministicBuilder::requireResolution() const {
	if (!resolution_) {
		throw std::invalid_argument("A resolution is required to build Deterministic '" + name_ + "'.");
	}
	return *resolution_;
}

std::unique_ptr<Deterministic> DeterministicBuilder::build(const RawTimeSeries &raw) const {
	return std::make_unique<Deterministic>(Deterministic::fromRaw(name_, raw, requireResolution(), options_));
}

std::unique_ptr<Deterministic> DeterministicBuilder::build(const std::map<TimePoint, TimeArray> &windows) const {
	auto forecast = Deterministic::fromTimeArrays(name_, windows, options_);
	if (resolution_ && *resolution_ != forecast.resolution()) {
		throw std::invalid_argument("Configured resolution " + resolution_->toString() +
		                            " does not match the TimeArray resolution " + forecast.resolution().toString() +
		                            ".");
	}
	return std::make_unique<Deterministic>(std::move(forecast));
}

std::unique_ptr<Deterministic> DeterministicBuilder::buildFromFile(const std::string &source,
                                                                   const std::string &owner_name,
                                                                   io::IRawSeriesReader &reader) const {
	return std::make_unique<Deterministic>(
	    Deterministic::fromFile(name_, source, owner_name, requireResolution(), reader, options_));
}

} // namespace fcaststore::core
