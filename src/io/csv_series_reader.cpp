#include "fcast-store/io/csv_series_reader.hpp"

#include "fcast-store/core/errors.hpp"
#include "fcast-store/utils/logging.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>

namespace fcaststore::io {

namespace {

std::string trim(const std::string &text) {
	const auto first = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c); });
	const auto last =
	    std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c); }).base();
	return first < last ? std::string(first, last) : std::string();
}

std::string lower(std::string text) {
	std::transform(text.begin(), text.end(), text.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return text;
}

double parseNumber(const std::string &text, const std::string &location) {
	const auto trimmed = trim(text);
	if (trimmed.empty()) {
		throw core::DataFormatError("Empty value at " + location + ".");
	}
	char *end = nullptr;
	const double value = std::strtod(trimmed.c_str(), &end);
	if (end != trimmed.c_str() + trimmed.size()) {
		throw core::DataFormatError("Cannot parse '" + trimmed + "' as a number at " + location + ".");
	}
	return value;
}

core::RawValue parseCell(const std::string &cell, const std::string &location) {
	if (cell.find(';') == std::string::npos) {
		return parseNumber(cell, location);
	}
	core::RawTuple tuple;
	std::size_t begin = 0;
	while (true) {
		const auto end = cell.find(';', begin);
		tuple.values.push_back(parseNumber(cell.substr(begin, end - begin), location));
		if (end == std::string::npos) {
			break;
		}
		begin = end + 1;
	}
	return tuple;
}

} // namespace

std::vector<std::string> CsvSeriesReader::splitLine(const std::string &line) {
	std::vector<std::string> result;
	std::string current;
	bool in_quotes = false;
	for (std::size_t i = 0; i < line.size(); i++) {
		char c = line[i];
		if (c == '"') {
			if (in_quotes && i + 1 < line.size() && line[i + 1] == '"') {
				current.push_back('"');
				i++;
			} else {
				in_quotes = !in_quotes;
			}
		} else if (c == ',' && !in_quotes) {
			result.push_back(current);
			current.clear();
		} else if ((c == '\r' || c == '\n') && !in_quotes) {
			continue;
		} else {
			current.push_back(c);
		}
	}
	result.push_back(current);
	return result;
}

core::RawTimeSeries CsvSeriesReader::read(core::SeriesKind kind, const std::string &source,
                                          const std::string &owner_name) {
	std::ifstream stream(source);
	if (!stream) {
		throw std::runtime_error("Cannot open forecast file '" + source + "'.");
	}

	std::string line;
	if (!std::getline(stream, line)) {
		throw core::DataFormatError("Forecast file '" + source + "' is empty.");
	}
	const auto headers = splitLine(line);
	if (headers.size() < 2) {
		throw core::DataFormatError("Forecast file '" + source +
		                            "' needs a timestamp column and at least one value column.");
	}

	std::optional<std::size_t> name_idx;
	for (std::size_t i = 1; i < headers.size(); i++) {
		if (lower(trim(headers[i])) == "name") {
			name_idx = i;
			break;
		}
	}

	core::RawTimeSeries result;
	std::size_t line_number = 1;
	std::size_t skipped = 0;
	while (std::getline(stream, line)) {
		++line_number;
		if (trim(line).empty()) {
			continue;
		}
		const auto fields = splitLine(line);
		const auto location = "'" + source + "' line " + std::to_string(line_number);
		if (fields.size() != headers.size()) {
			throw core::DataFormatError("Expected " + std::to_string(headers.size()) + " fields but found " +
			                            std::to_string(fields.size()) + " at " + location + ".");
		}
		if (name_idx && trim(fields[*name_idx]) != owner_name) {
			++skipped;
			continue;
		}

		const auto start = core::parseTimestamp(trim(fields[0]));
		std::vector<core::RawValue> window;
		window.reserve(fields.size() - 1);
		for (std::size_t i = 1; i < fields.size(); i++) {
			if (name_idx && i == *name_idx) {
				continue;
			}
			window.push_back(parseCell(fields[i], location + " column " + std::to_string(i + 1)));
		}
		if (!result.emplace(start, std::move(window)).second) {
			throw core::DataFormatError("Duplicate window start " + core::formatTimestamp(start) + " at " + location +
			                            ".");
		}
	}

	if (skipped > 0) {
		FCAST_DEBUG("Skipped {} rows of other owners in '{}'.", skipped, source);
	}
	if (result.empty()) {
		throw std::invalid_argument("No " + core::toString(kind) + " rows for '" + owner_name + "' in '" + source +
		                            "'.");
	}
	FCAST_INFO("Read {} {} windows for '{}' from '{}'.", result.size(), core::toString(kind), owner_name, source);
	return result;
}

} // namespace fcaststore::io
