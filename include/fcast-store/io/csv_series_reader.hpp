#pragma once

#include "fcast-store/io/raw_series_reader.hpp"

#include <string>
#include <vector>

namespace fcaststore::io {

/**
 * @class CsvSeriesReader
 * @brief Reads forecast windows from a comma separated file.
 *
 * Layout: a header row, then one row per window. The first column holds the window
 * start as "YYYY-MM-DDTHH:MM:SS[.mmm]" (UTC, 'T' or space separated). An optional
 * column named "name" restricts rows to one owner. Every other column is one
 * timestep of the window. A cell is a number, or numbers joined by ';' for a
 * polynomial coefficient tuple.
 */
class CsvSeriesReader final : public IRawSeriesReader {
public:
	/**
	 * @throws std::runtime_error If @p source cannot be opened.
	 * @throws core::DataFormatError If a row or cell is malformed.
	 * @throws std::invalid_argument If no row belongs to @p owner_name.
	 */
	core::RawTimeSeries read(core::SeriesKind kind, const std::string &source,
	                         const std::string &owner_name) override;

	/// Splits one CSV line, honouring double quotes.
	static std::vector<std::string> splitLine(const std::string &line);
};

} // namespace fcaststore::io
