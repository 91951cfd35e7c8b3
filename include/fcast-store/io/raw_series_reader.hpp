#pragma once

#include "fcast-store/core/metadata.hpp"
#include "fcast-store/core/raw_series.hpp"

#include <string>

namespace fcaststore::io {

/**
 * @class IRawSeriesReader
 * @brief Source of raw timestamp -> values mappings for file based construction.
 */
class IRawSeriesReader {
public:
	virtual ~IRawSeriesReader() = default;

	/**
	 * @brief Reads the forecast windows of @p owner_name from @p source.
	 * @param kind The kind of series the caller is about to build.
	 */
	virtual core::RawTimeSeries read(core::SeriesKind kind, const std::string &source,
	                                 const std::string &owner_name) = 0;
};

} // namespace fcaststore::io
