#pragma once

#include "fcast-store/core/array_shaping.hpp"
#include "fcast-store/core/metadata.hpp"
#include "fcast-store/core/normalization.hpp"
#include "fcast-store/core/raw_series.hpp"
#include "fcast-store/core/time_types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace fcaststore::core {

/**
 * @struct SeriesBuildOptions
 * @brief Construction settings shared by every series kind.
 */
struct SeriesBuildOptions {
	/// Divisor applied to every payload value at construction.
	NormalizationFactor normalization_factor = 1.0;
	/// Stored in the metadata only; the owning entity applies it at read time.
	std::optional<std::string> scaling_factor_multiplier;
	PayloadInference payload_inference = PayloadInference::Strict;
	Features features;
};

/**
 * @class ForecastSeries
 * @brief Common interface of Deterministic, Probabilistic, Scenarios and SingleTimeSeries.
 *
 * A series is immutable once constructed. Rebuilding its payload means constructing a
 * new series, which receives a fresh payload id.
 */
class ForecastSeries {
public:
	virtual ~ForecastSeries() = default;

	virtual SeriesKind kind() const = 0;

	/// Number of forecast windows.
	virtual std::size_t count() const = 0;

	/// Number of timesteps in one window.
	virtual std::size_t horizon() const = 0;

	/// Spacing between window starts; zero when count() <= 1.
	virtual Duration interval() const = 0;

	/**
	 * @throws std::out_of_range If the series holds no windows.
	 */
	virtual TimePoint initialTimestamp() const = 0;

	/// Dense array ready to be handed to an array writer.
	virtual DenseArray shapeForStorage() const = 0;

	/// Window-start timestamps derived from initialTimestamp(), count() and interval().
	std::vector<TimePoint> initialTimes() const;

	/// Span from the first window start to the last timestep of the last window.
	Duration totalPeriod() const;

	virtual SeriesMetadata metadata() const;

	const std::string &name() const {
		return name_;
	}

	const Period &resolution() const {
		return resolution_;
	}

	const PayloadId &payloadId() const {
		return payload_id_;
	}

	const std::optional<std::string> &scalingFactorMultiplier() const {
		return scaling_factor_multiplier_;
	}

	const Features &features() const {
		return features_;
	}

protected:
	ForecastSeries(std::string name, Period resolution, PayloadId payload_id,
	               std::optional<std::string> scaling_factor_multiplier, Features features);

	ForecastSeries(const ForecastSeries &) = default;
	ForecastSeries(ForecastSeries &&) = default;
	ForecastSeries &operator=(const ForecastSeries &) = default;
	ForecastSeries &operator=(ForecastSeries &&) = default;

	/**
	 * @brief Checks that the payload this series was rejoined with has the count and horizon
	 *        recorded in @p metadata.
	 * @throws std::invalid_argument On a mismatch.
	 */
	void requireRecordedGeometry(const SeriesMetadata &metadata) const;

	/// Replaces the payload id; used when a copy takes a new payload.
	void renewPayloadId() {
		payload_id_ = PayloadId::generate();
	}

private:
	std::string name_;
	Period resolution_;
	PayloadId payload_id_;
	std::optional<std::string> scaling_factor_multiplier_;
	Features features_;
};

} // namespace fcaststore::core
