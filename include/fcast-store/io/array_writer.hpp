#pragma once

#include "fcast-store/core/array_shaping.hpp"
#include "fcast-store/core/forecast_series.hpp"
#include "fcast-store/core/metadata.hpp"

#include <cstddef>
#include <map>

namespace fcaststore::io {

/**
 * @class IArrayWriter
 * @brief Destination for shaped forecast arrays, keyed by payload id.
 */
class IArrayWriter {
public:
	virtual ~IArrayWriter() = default;

	virtual void write(const core::PayloadId &id, const core::DenseArray &array) = 0;
};

/**
 * @class InMemoryArrayStore
 * @brief IArrayWriter keeping every array in a map.
 */
class InMemoryArrayStore final : public IArrayWriter {
public:
	/**
	 * @throws std::invalid_argument If @p id is nil or already stored.
	 */
	void write(const core::PayloadId &id, const core::DenseArray &array) override;

	/**
	 * @throws std::out_of_range If nothing is stored under @p id.
	 */
	const core::DenseArray &read(const core::PayloadId &id) const;

	bool contains(const core::PayloadId &id) const {
		return arrays_.count(id) > 0;
	}

	/// Returns false when nothing was stored under @p id.
	bool remove(const core::PayloadId &id);

	std::size_t size() const {
		return arrays_.size();
	}

private:
	std::map<core::PayloadId, core::DenseArray> arrays_;
};

/**
 * @brief Shapes @p series and writes it under its payload id.
 * @return The metadata to persist alongside the array.
 */
core::SeriesMetadata storeSeries(IArrayWriter &writer, const core::ForecastSeries &series);

} // namespace fcaststore::io
