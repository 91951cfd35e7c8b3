#pragma once

#include "fcast-store/core/forecast_series.hpp"
#include "fcast-store/core/windowed_store.hpp"

#include <Eigen/Dense>

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fcaststore::core {

/// Raw input of a Probabilistic or Scenarios forecast: window start -> rows of values.
using RawRowSeries = std::map<TimePoint, std::vector<Row>>;

/// Raw input as one (horizon x components) matrix per window start.
using RawMatrixSeries = std::map<TimePoint, Eigen::MatrixXd>;

/**
 * @class RowForecast
 * @brief Base of forecasts that hold several values per timestep (percentiles, scenarios).
 *
 * Every timestep of every window is a row with the same number of components.
 */
class RowForecast : public ForecastSeries {
public:
	std::size_t count() const override {
		return data_.count();
	}
	std::size_t horizon() const override {
		return data_.horizon();
	}
	Duration interval() const override {
		return data_.interval();
	}
	TimePoint initialTimestamp() const override {
		return data_.initialTimestamp();
	}

	/// Number of values per timestep.
	std::size_t componentCount() const {
		return component_count_;
	}

	const RowStore &data() const {
		return data_;
	}

	/**
	 * @throws std::invalid_argument If @p start_time is not a window start.
	 */
	RowStore::Window getWindow(const TimePoint &start_time, std::optional<std::size_t> len = std::nullopt) const {
		return data_.window(start_time, len);
	}

	/// The window as a (horizon x components) matrix.
	Eigen::MatrixXd windowMatrix(const TimePoint &start_time) const;

	RowStore::WindowRange iterateWindows() const {
		return data_.windows();
	}

	/// [horizon, count, components]
	DenseArray shapeForStorage() const override;

protected:
	RowForecast(std::string name, Period resolution, PayloadId payload_id,
	            std::optional<std::string> scaling_factor_multiplier, Features features, RowStore data,
	            std::size_t component_count);

	RowForecast(const RowForecast &source, RowStore data);

	static RowStore toRowStore(const RawMatrixSeries &matrices);

	RowStore data_;
	std::size_t component_count_ = 0;

private:
	void validateRows() const;
};

/**
 * @class Probabilistic
 * @brief Percentile forecast: each timestep holds one value per percentile label.
 */
class Probabilistic final : public RowForecast {
public:
	/**
	 * @throws std::invalid_argument If percentiles are empty, unsorted or outside [0, 100].
	 * @throws DataFormatError If a row width differs from the number of percentiles.
	 */
	static Probabilistic fromRaw(std::string name, const RawRowSeries &windows, std::vector<double> percentiles,
	                             Period resolution, const SeriesBuildOptions &options = SeriesBuildOptions{});

	static Probabilistic fromMatrices(std::string name, const RawMatrixSeries &windows,
	                                  std::vector<double> percentiles, Period resolution,
	                                  const SeriesBuildOptions &options = SeriesBuildOptions{});

	static Probabilistic fromMetadata(const SeriesMetadata &metadata, RowStore data);

	/// Copies every field of @p source but takes @p data as payload and a new payload id.
	Probabilistic(const Probabilistic &source, RowStore data);

	SeriesKind kind() const override {
		return SeriesKind::Probabilistic;
	}

	const std::vector<double> &percentiles() const {
		return percentiles_;
	}

	SeriesMetadata metadata() const override;

private:
	Probabilistic(std::string name, Period resolution, PayloadId payload_id,
	              std::optional<std::string> scaling_factor_multiplier, Features features, RowStore data,
	              std::vector<double> percentiles);

	std::vector<double> percentiles_;
};

/**
 * @class Scenarios
 * @brief Scenario ensemble: each timestep holds one value per scenario.
 */
class Scenarios final : public RowForecast {
public:
	/**
	 * @brief The scenario count is taken from the row width.
	 * @throws DataFormatError If rows differ in width or hold no scenario.
	 */
	static Scenarios fromRaw(std::string name, const RawRowSeries &windows, Period resolution,
	                         const SeriesBuildOptions &options = SeriesBuildOptions{});

	static Scenarios fromMatrices(std::string name, const RawMatrixSeries &windows, Period resolution,
	                              const SeriesBuildOptions &options = SeriesBuildOptions{});

	static Scenarios fromMetadata(const SeriesMetadata &metadata, RowStore data);

	/// Copies every field of @p source but takes @p data as payload and a new payload id.
	Scenarios(const Scenarios &source, RowStore data);

	SeriesKind kind() const override {
		return SeriesKind::Scenarios;
	}

	std::size_t scenarioCount() const {
		return componentCount();
	}

	SeriesMetadata metadata() const override;

private:
	Scenarios(std::string name, Period resolution, PayloadId payload_id,
	          std::optional<std::string> scaling_factor_multiplier, Features features, RowStore data,
	          std::size_t scenario_count);
};

} // namespace fcaststore::core
