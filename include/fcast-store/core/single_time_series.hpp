#pragma once

#include "fcast-store/core/forecast_series.hpp"
#include "fcast-store/core/series_data.hpp"
#include "fcast-store/core/time_array.hpp"

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace fcaststore::core {

/**
 * @class SingleTimeSeries
 * @brief One contiguous trajectory without window repetition.
 *
 * Behaves as a forecast with a single window: count() is 1 and interval() is zero.
 */
class SingleTimeSeries final : public ForecastSeries {
public:
	/**
	 * @throws std::invalid_argument If @p data is empty.
	 */
	SingleTimeSeries(std::string name, TimePoint initial_timestamp, Period resolution, const WindowData &data,
	                 const SeriesBuildOptions &options = SeriesBuildOptions{});

	/// Copies every field of @p source but takes @p data as payload and a new payload id.
	SingleTimeSeries(const SingleTimeSeries &source, WindowData data);

	/**
	 * @brief Builds from a single-column TimeArray; the resolution is inferred from its timestamps.
	 * @throws std::invalid_argument If the array has more than one value column.
	 * @throws DataFormatError If the timestamps are not uniformly spaced.
	 */
	static SingleTimeSeries fromTimeArray(std::string name, const TimeArray &array,
	                                      const SeriesBuildOptions &options = SeriesBuildOptions{});

	static SingleTimeSeries fromMetadata(const SeriesMetadata &metadata, WindowData data);

	SeriesKind kind() const override {
		return SeriesKind::SingleTimeSeries;
	}

	std::size_t count() const override {
		return 1;
	}
	std::size_t horizon() const override {
		return windowLength(data_);
	}
	Duration interval() const override {
		return Duration::zero();
	}
	TimePoint initialTimestamp() const override {
		return initial_timestamp_;
	}

	PayloadKind payloadKind() const {
		return core::payloadKind(data_);
	}

	const WindowData &data() const {
		return data_;
	}

	/**
	 * @brief Returns the trajectory, truncated to @p len entries when @p len is given and not
	 *        larger than the horizon.
	 * @throws std::invalid_argument If @p start_time is not initialTimestamp().
	 */
	WindowData getWindow(const TimePoint &start_time, std::optional<std::size_t> len = std::nullopt) const;

	/// The single (initialTimestamp(), trajectory) pair.
	std::vector<std::pair<TimePoint, WindowData>> iterateWindows() const {
		return {{initial_timestamp_, data_}};
	}

	/// initialTimestamp() + i * resolution() for every timestep.
	std::vector<TimePoint> timestamps() const;

	/**
	 * @brief Derived series covering @p length timesteps starting at @p start.
	 * @throws std::invalid_argument If @p start is not a timestep or the range exceeds the series.
	 */
	SingleTimeSeries subset(const TimePoint &start, std::size_t length) const;

	/**
	 * @throws NotImplementedError If the payload is not Constant.
	 */
	TimeArray toTimeArray() const;

	/// [horizon], [horizon, degree] or [horizon, n_points, 2]
	DenseArray shapeForStorage() const override;

private:
	SingleTimeSeries(std::string name, TimePoint initial_timestamp, Period resolution, PayloadId payload_id,
	                 std::optional<std::string> scaling_factor_multiplier, Features features, WindowData data);

	TimePoint initial_timestamp_;
	WindowData data_;
};

} // namespace fcaststore::core
