#pragma once

#include "fcast-store/core/payload.hpp"
#include "fcast-store/core/time_types.hpp"
#include "fcast-store/core/windowed_store.hpp"

#include <cstddef>
#include <iterator>
#include <utility>
#include <variant>
#include <vector>

namespace fcaststore::core {

/// Payload of a Deterministic forecast: a windowed store of exactly one element kind.
using SeriesData = std::variant<ConstantStore, PolynomialStore, PiecewiseLinearStore, PiecewiseStepStore>;

/// One window of a Deterministic forecast or the trajectory of a SingleTimeSeries.
using WindowData = std::variant<std::vector<double>, std::vector<Polynomial>, std::vector<PiecewiseLinear>,
                                std::vector<PiecewiseStep>>;

PayloadKind payloadKind(const SeriesData &data);
PayloadKind payloadKind(const WindowData &data);

std::size_t windowLength(const WindowData &data);

/**
 * @class WindowIterator
 * @brief Forward iterator over the (start, window) pairs of a SeriesData, in ascending order.
 *
 * Dereferencing copies the current window into a WindowData.
 */
class WindowIterator {
public:
	using iterator_category = std::forward_iterator_tag;
	using value_type = std::pair<TimePoint, WindowData>;
	using difference_type = std::ptrdiff_t;
	using pointer = void;
	using reference = value_type;

	using Position = std::variant<ConstantStore::const_iterator, PolynomialStore::const_iterator,
	                              PiecewiseLinearStore::const_iterator, PiecewiseStepStore::const_iterator>;

	explicit WindowIterator(Position position) : position_(std::move(position)) {
	}

	value_type operator*() const {
		return std::visit([](const auto &it) { return value_type{it->first, WindowData{it->second}}; }, position_);
	}

	WindowIterator &operator++() {
		std::visit([](auto &it) { ++it; }, position_);
		return *this;
	}

	WindowIterator operator++(int) {
		WindowIterator copy = *this;
		++(*this);
		return copy;
	}

	bool operator==(const WindowIterator &other) const {
		return position_ == other.position_;
	}
	bool operator!=(const WindowIterator &other) const {
		return !(*this == other);
	}

private:
	Position position_;
};

/**
 * @class WindowSequence
 * @brief Restartable range over the windows of a SeriesData.
 */
class WindowSequence {
public:
	explicit WindowSequence(const SeriesData &data) : data_(&data) {
	}

	WindowIterator begin() const {
		return std::visit([](const auto &store) { return WindowIterator(WindowIterator::Position(store.begin())); },
		                  *data_);
	}

	WindowIterator end() const {
		return std::visit([](const auto &store) { return WindowIterator(WindowIterator::Position(store.end())); },
		                  *data_);
	}

	std::size_t size() const {
		return std::visit([](const auto &store) { return store.count(); }, *data_);
	}

private:
	const SeriesData *data_;
};

} // namespace fcaststore::core
