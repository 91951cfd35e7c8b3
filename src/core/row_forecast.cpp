#include "fcast-store/core/row_forecast.hpp"

#include "fcast-store/core/array_shaping.hpp"
#include "fcast-store/core/errors.hpp"
#include "fcast-store/utils/logging.hpp"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace fcaststore::core {

namespace {

void validatePercentiles(const std::vector<double> &percentiles) {
	if (percentiles.empty()) {
		throw std::invalid_argument("A probabilistic forecast needs at least one percentile.");
	}
	for (std::size_t i = 0; i < percentiles.size(); ++i) {
		const double p = percentiles[i];
		if (!std::isfinite(p) || p < 0.0 || p > 100.0) {
			throw std::invalid_argument("Percentile " + std::to_string(p) + " is outside [0, 100].");
		}
		if (i > 0 && !(p > percentiles[i - 1])) {
			throw std::invalid_argument("Percentiles must be strictly increasing.");
		}
	}
}

std::size_t firstRowWidth(const RawRowSeries &windows) {
	for (const auto &entry : windows) {
		if (!entry.second.empty()) {
			return entry.second.front().size();
		}
	}
	return 0;
}

} // namespace

// --- RowForecast ---

RowForecast::RowForecast(std::string name, Period resolution, PayloadId payload_id,
                         std::optional<std::string> scaling_factor_multiplier, Features features, RowStore data,
                         std::size_t component_count)
    : ForecastSeries(std::move(name), resolution, payload_id, std::move(scaling_factor_multiplier),
                     std::move(features)),
      data_(std::move(data)), component_count_(component_count) {
	validateRows();
}

RowForecast::RowForecast(const RowForecast &source, RowStore data)
    : ForecastSeries(source), data_(std::move(data)), component_count_(source.component_count_) {
	validateRows();
	renewPayloadId();
}

void RowForecast::validateRows() const {
	if (component_count_ == 0) {
		throw DataFormatError("Forecast '" + name() + "' must hold at least one value per timestep.");
	}
	for (const auto &entry : data_) {
		for (std::size_t r = 0; r < entry.second.size(); ++r) {
			if (entry.second[r].size() != component_count_) {
				throw DataFormatError("Forecast '" + name() + "' window " + formatTimestamp(entry.first) + " step " +
				                      std::to_string(r) + " has " + std::to_string(entry.second[r].size()) +
				                      " values, expected " + std::to_string(component_count_) + ".");
			}
		}
	}
}

RowStore RowForecast::toRowStore(const RawMatrixSeries &matrices) {
	RowStore::Map windows;
	for (const auto &entry : matrices) {
		const auto &matrix = entry.second;
		std::vector<Row> rows(static_cast<std::size_t>(matrix.rows()));
		for (Eigen::Index r = 0; r < matrix.rows(); ++r) {
			auto &row = rows[static_cast<std::size_t>(r)];
			row.resize(static_cast<std::size_t>(matrix.cols()));
			for (Eigen::Index c = 0; c < matrix.cols(); ++c) {
				row[static_cast<std::size_t>(c)] = matrix(r, c);
			}
		}
		windows.emplace(entry.first, std::move(rows));
	}
	return RowStore(std::move(windows));
}

Eigen::MatrixXd RowForecast::windowMatrix(const TimePoint &start_time) const {
	const auto &rows = data_.at(start_time);
	Eigen::MatrixXd matrix(static_cast<Eigen::Index>(rows.size()), static_cast<Eigen::Index>(component_count_));
	for (std::size_t r = 0; r < rows.size(); ++r) {
		for (std::size_t c = 0; c < component_count_; ++c) {
			matrix(static_cast<Eigen::Index>(r), static_cast<Eigen::Index>(c)) = rows[r][c];
		}
	}
	return matrix;
}

DenseArray RowForecast::shapeForStorage() const {
	return core::shapeForStorage(data_);
}

// --- Probabilistic ---

Probabilistic::Probabilistic(std::string name, Period resolution, PayloadId payload_id,
                             std::optional<std::string> scaling_factor_multiplier, Features features, RowStore data,
                             std::vector<double> percentiles)
    : RowForecast(std::move(name), resolution, payload_id, std::move(scaling_factor_multiplier), std::move(features),
                  std::move(data), percentiles.size()),
      percentiles_(std::move(percentiles)) {
}

Probabilistic::Probabilistic(const Probabilistic &source, RowStore data)
    : RowForecast(source, std::move(data)), percentiles_(source.percentiles_) {
}

Probabilistic Probabilistic::fromRaw(std::string name, const RawRowSeries &windows, std::vector<double> percentiles,
                                     Period resolution, const SeriesBuildOptions &options) {
	validatePercentiles(percentiles);
	auto store = options.normalization_factor.apply(RowStore(RowStore::Map(windows.begin(), windows.end())));
	Probabilistic forecast(std::move(name), resolution, PayloadId::generate(), options.scaling_factor_multiplier,
	                       options.features, std::move(store), std::move(percentiles));
	FCAST_DEBUG("Built Probabilistic '{}' with {} windows, horizon {}, {} percentiles.", forecast.name(),
	            forecast.count(), forecast.horizon(), forecast.percentiles().size());
	return forecast;
}

Probabilistic Probabilistic::fromMatrices(std::string name, const RawMatrixSeries &windows,
                                          std::vector<double> percentiles, Period resolution,
                                          const SeriesBuildOptions &options) {
	const auto store = toRowStore(windows);
	return fromRaw(std::move(name), store.data(), std::move(percentiles), resolution, options);
}

Probabilistic Probabilistic::fromMetadata(const SeriesMetadata &metadata, RowStore data) {
	if (metadata.kind != SeriesKind::Probabilistic) {
		throw std::invalid_argument("Metadata of '" + metadata.name + "' describes a " + toString(metadata.kind) +
		                            " series, not a Probabilistic one.");
	}
	validatePercentiles(metadata.percentiles);
	Probabilistic series(metadata.name, metadata.resolution, metadata.payload_id, metadata.scaling_factor_multiplier,
	                     metadata.features, std::move(data), metadata.percentiles);
	series.requireRecordedGeometry(metadata);
	return series;
}

SeriesMetadata Probabilistic::metadata() const {
	auto meta = ForecastSeries::metadata();
	meta.percentiles = percentiles_;
	return meta;
}

// --- Scenarios ---

Scenarios::Scenarios(std::string name, Period resolution, PayloadId payload_id,
                     std::optional<std::string> scaling_factor_multiplier, Features features, RowStore data,
                     std::size_t scenario_count)
    : RowForecast(std::move(name), resolution, payload_id, std::move(scaling_factor_multiplier), std::move(features),
                  std::move(data), scenario_count) {
}

Scenarios::Scenarios(const Scenarios &source, RowStore data) : RowForecast(source, std::move(data)) {
}

Scenarios Scenarios::fromRaw(std::string name, const RawRowSeries &windows, Period resolution,
                             const SeriesBuildOptions &options) {
	const auto scenario_count = firstRowWidth(windows);
	auto store = options.normalization_factor.apply(RowStore(RowStore::Map(windows.begin(), windows.end())));
	Scenarios forecast(std::move(name), resolution, PayloadId::generate(), options.scaling_factor_multiplier,
	                   options.features, std::move(store), scenario_count);
	FCAST_DEBUG("Built Scenarios '{}' with {} windows, horizon {}, {} scenarios.", forecast.name(), forecast.count(),
	            forecast.horizon(), forecast.scenarioCount());
	return forecast;
}

Scenarios Scenarios::fromMatrices(std::string name, const RawMatrixSeries &windows, Period resolution,
                                  const SeriesBuildOptions &options) {
	const auto store = toRowStore(windows);
	return fromRaw(std::move(name), store.data(), resolution, options);
}

Scenarios Scenarios::fromMetadata(const SeriesMetadata &metadata, RowStore data) {
	if (metadata.kind != SeriesKind::Scenarios) {
		throw std::invalid_argument("Metadata of '" + metadata.name + "' describes a " + toString(metadata.kind) +
		                            " series, not a Scenarios one.");
	}
	Scenarios series(metadata.name, metadata.resolution, metadata.payload_id, metadata.scaling_factor_multiplier,
	                 metadata.features, std::move(data), metadata.scenario_count);
	series.requireRecordedGeometry(metadata);
	return series;
}

SeriesMetadata Scenarios::metadata() const {
	auto meta = ForecastSeries::metadata();
	meta.scenario_count = scenarioCount();
	return meta;
}

} // namespace fcaststore::core
