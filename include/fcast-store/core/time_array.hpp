#pragma once

#include "fcast-store/core/resolution.hpp"
#include "fcast-store/core/time_types.hpp"

#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace fcaststore::core {

/**
 * @class TimeArray
 * @brief Tabular time-indexed data: one timestamp column plus one or more value columns.
 *
 * Timestamps and values are stored in separate vectors, values column by column.
 * The number of timestamps always matches the length of every column and timestamps
 * are strictly increasing.
 */
class TimeArray {
public:
	using Value = double;
	enum class ValueLayout { ByRow, ByColumn };

	TimeArray() = default;

	/**
	 * @brief Constructs a single-column TimeArray.
	 * @throws std::invalid_argument If the sizes of timestamps and values vectors do not match.
	 */
	TimeArray(std::vector<TimePoint> timestamps, std::vector<Value> values)
	    : timestamps_(std::move(timestamps)), columns_(1) {
		if (timestamps_.size() != values.size()) {
			throw std::invalid_argument("Timestamps and values vectors must have the same size.");
		}
		columns_[0] = std::move(values);
		validateTimestampOrder();
	}

	TimeArray(std::vector<TimePoint> timestamps, std::vector<std::vector<Value>> values, ValueLayout layout)
	    : timestamps_(std::move(timestamps)) {
		if (layout == ValueLayout::ByRow) {
			initializeFromRows(std::move(values));
		} else {
			initializeFromColumns(std::move(values));
		}
		validateTimestampOrder();
	}

	const std::vector<TimePoint> &timestamps() const {
		return timestamps_;
	}

	/**
	 * @brief Values of the first column.
	 * @throws std::runtime_error If the array has no value columns.
	 */
	const std::vector<Value> &values() const {
		if (columns_.empty()) {
			throw std::runtime_error("TimeArray contains no value columns.");
		}
		return columns_.front();
	}

	std::size_t columnCount() const {
		return columns_.size();
	}

	std::size_t size() const {
		return timestamps_.size();
	}

	/// Sampling resolution of the timestamps, see inferResolution().
	Period resolution() const {
		return inferResolution(timestamps_);
	}

	bool operator==(const TimeArray &other) const {
		return timestamps_ == other.timestamps_ && columns_ == other.columns_;
	}
	bool operator!=(const TimeArray &other) const {
		return !(*this == other);
	}

private:
	void initializeFromRows(std::vector<std::vector<Value>> rows) {
		if (rows.size() != timestamps_.size()) {
			throw std::invalid_argument("Row-major values must match the number of timestamps.");
		}
		if (rows.empty()) {
			columns_.clear();
			return;
		}
		const auto column_count = rows.front().size();
		for (const auto &row : rows) {
			if (row.size() != column_count) {
				throw std::invalid_argument("All rows must have the same number of columns.");
			}
		}
		columns_.assign(column_count, std::vector<Value>(rows.size()));
		for (std::size_t i = 0; i < rows.size(); ++i) {
			for (std::size_t j = 0; j < column_count; ++j) {
				columns_[j][i] = rows[i][j];
			}
		}
	}

	void initializeFromColumns(std::vector<std::vector<Value>> columns) {
		for (const auto &column : columns) {
			if (column.size() != timestamps_.size()) {
				throw std::invalid_argument("Column-major values must align with the number of timestamps.");
			}
		}
		columns_ = std::move(columns);
	}

	void validateTimestampOrder() const {
		for (std::size_t i = 1; i < timestamps_.size(); ++i) {
			if (!(timestamps_[i] > timestamps_[i - 1])) {
				throw std::invalid_argument("TimeArray timestamps must be strictly increasing and unique.");
			}
		}
	}

	std::vector<TimePoint> timestamps_;
	std::vector<std::vector<Value>> columns_;
};

} // namespace fcaststore::core
