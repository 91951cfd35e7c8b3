#include "fcast-store/io/array_writer.hpp"

#include "fcast-store/utils/logging.hpp"

#include <stdexcept>

namespace fcaststore::io {

void InMemoryArrayStore::write(const core::PayloadId &id, const core::DenseArray &array) {
	if (id.isNil()) {
		throw std::invalid_argument("Cannot store an array under the nil payload id.");
	}
	if (!arrays_.emplace(id, array).second) {
		throw std::invalid_argument("An array is already stored under payload id " + id.toString() + ".");
	}
	FCAST_TRACE("Stored array {} under {}.", array.shapeString(), id.toString());
}

const core::DenseArray &InMemoryArrayStore::read(const core::PayloadId &id) const {
	const auto it = arrays_.find(id);
	if (it == arrays_.end()) {
		throw std::out_of_range("No array stored under payload id " + id.toString() + ".");
	}
	return it->second;
}

bool InMemoryArrayStore::remove(const core::PayloadId &id) {
	return arrays_.erase(id) > 0;
}

core::SeriesMetadata storeSeries(IArrayWriter &writer, const core::ForecastSeries &series) {
	const auto array = series.shapeForStorage();
	writer.write(series.payloadId(), array);
	FCAST_DEBUG("Wrote {} '{}' with shape {}.", core::toString(series.kind()), series.name(), array.shapeString());
	return series.metadata();
}

} // namespace fcaststore::io
