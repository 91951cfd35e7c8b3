#pragma once

#include "fcast-store/core/forecast_series.hpp"
#include "fcast-store/core/series_data.hpp"
#include "fcast-store/core/time_array.hpp"

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fcaststore::io {
class IRawSeriesReader;
}

namespace fcaststore::core {

class DeterministicBuilder;

/**
 * @class Deterministic
 * @brief Point forecast: one trajectory per forecast issue time.
 *
 * The payload is a windowed store of a single element kind (Constant, Polynomial,
 * PiecewiseLinear or PiecewiseStep).
 */
class Deterministic final : public ForecastSeries {
public:
	friend class DeterministicBuilder;

	/**
	 * @brief Constructs a series from an already typed payload.
	 * @throws std::invalid_argument If the name is empty or the resolution is not positive.
	 */
	Deterministic(std::string name, const SeriesData &data, Period resolution,
	              const SeriesBuildOptions &options = SeriesBuildOptions{});

	/**
	 * @brief Copies every field of @p source but takes @p data as payload and a new payload id.
	 */
	Deterministic(const Deterministic &source, SeriesData data);

	/**
	 * @brief Classifies and normalizes a raw timestamp -> values mapping.
	 * @throws DataFormatError If the values do not share one payload shape.
	 */
	static Deterministic fromRaw(std::string name, const RawTimeSeries &raw, Period resolution,
	                             const SeriesBuildOptions &options = SeriesBuildOptions{});

	static Deterministic fromValues(std::string name, const std::map<TimePoint, std::vector<double>> &values,
	                                Period resolution, const SeriesBuildOptions &options = SeriesBuildOptions{});

	/**
	 * @brief Builds from one single-column TimeArray per window; the resolution is
	 *        inferred from the first array.
	 * @throws std::invalid_argument If any array has more than one value column.
	 */
	static Deterministic fromTimeArrays(std::string name, const std::map<TimePoint, TimeArray> &windows,
	                                    const SeriesBuildOptions &options = SeriesBuildOptions{});

	/**
	 * @brief Reads the raw mapping for @p owner_name from @p source through @p reader.
	 */
	static Deterministic fromFile(std::string name, const std::string &source, const std::string &owner_name,
	                              Period resolution, io::IRawSeriesReader &reader,
	                              const SeriesBuildOptions &options = SeriesBuildOptions{});

	/**
	 * @brief Rejoins stored metadata with its payload; the metadata's payload id is kept.
	 */
	static Deterministic fromMetadata(const SeriesMetadata &metadata, SeriesData data);

	/**
	 * @brief Derived series holding only the windows that start at @p start_times.
	 * @throws std::invalid_argument If a requested start is not a window start or the selected
	 *         starts are not evenly spaced.
	 */
	Deterministic subset(const std::vector<TimePoint> &start_times) const;

	SeriesKind kind() const override {
		return SeriesKind::Deterministic;
	}

	std::size_t count() const override;
	std::size_t horizon() const override;
	Duration interval() const override;
	TimePoint initialTimestamp() const override;

	PayloadKind payloadKind() const {
		return core::payloadKind(data_);
	}

	const SeriesData &data() const {
		return data_;
	}

	/**
	 * @brief Typed access to the payload store.
	 * @throws std::invalid_argument If the payload holds a different element kind.
	 */
	template <typename Element>
	const WindowedStore<Element> &store() const {
		const auto *typed = std::get_if<WindowedStore<Element>>(&data_);
		if (typed == nullptr) {
			throw std::invalid_argument("Forecast '" + name() + "' holds " + toString(payloadKind()) +
			                            " data, not " + toString(PayloadTraits<Element>::kind) + ".");
		}
		return *typed;
	}

	/**
	 * @brief Returns the window starting at @p start_time, truncated to @p len entries when
	 *        @p len is given and not larger than the horizon.
	 * @throws std::invalid_argument If @p start_time is not a window start.
	 */
	WindowData getWindow(const TimePoint &start_time, std::optional<std::size_t> len = std::nullopt) const;

	/// Restartable range of (start, window) pairs in ascending order.
	WindowSequence iterateWindows() const {
		return WindowSequence(data_);
	}

	/**
	 * @brief Materializes the trajectory of the only window as a TimeArray.
	 * @throws NotImplementedError If count() != 1 or the payload is not Constant.
	 */
	TimeArray makeTimeArray() const;

	DenseArray shapeForStorage() const override;

private:
	Deterministic(std::string name, Period resolution, PayloadId payload_id,
	              std::optional<std::string> scaling_factor_multiplier, Features features, SeriesData data);

	SeriesData data_;
};

/**
 * @class DeterministicBuilder
 * @brief A builder for fluently configuring and creating Deterministic forecasts.
 */
class DeterministicBuilder {
public:
	DeterministicBuilder &withName(std::string name);
	DeterministicBuilder &withResolution(Period resolution);
	DeterministicBuilder &withNormalizationFactor(NormalizationFactor factor);
	DeterministicBuilder &withScalingFactorMultiplier(std::string multiplier);
	DeterministicBuilder &withFeature(std::string key, std::string value);

	/**
	 * @brief Opt in to treating a mapping without any value as constant data.
	 */
	DeterministicBuilder &withPayloadInference(PayloadInference inference);

	std::unique_ptr<Deterministic> build(const RawTimeSeries &raw) const;
	std::unique_ptr<Deterministic> build(const std::map<TimePoint, TimeArray> &windows) const;
	std::unique_ptr<Deterministic> buildFromFile(const std::string &source, const std::string &owner_name,
	                                             io::IRawSeriesReader &reader) const;

	const SeriesBuildOptions &options() const {
		return options_;
	}

private:
	Period requireResolution() const;

	std::string name_;
	std::optional<Period> resolution_;
	SeriesBuildOptions options_;
};

} // namespace fcaststore::core
