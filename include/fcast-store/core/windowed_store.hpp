#pragma once

#include "fcast-store/core/errors.hpp"
#include "fcast-store/core/payload.hpp"
#include "fcast-store/core/time_types.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace fcaststore::core {

/**
 * @brief Produces the @p count window-start timestamps beginning at @p initial_timestamp.
 *
 * Returns an empty sequence for count == 0 and exactly [initial_timestamp] when the
 * interval is zero, regardless of count.
 */
inline std::vector<TimePoint> initialTimes(const TimePoint &initial_timestamp, std::size_t count,
                                           Duration interval) {
	std::vector<TimePoint> times;
	if (count == 0) {
		return times;
	}
	if (interval == Duration::zero()) {
		times.push_back(initial_timestamp);
		return times;
	}
	times.reserve(count);
	for (std::size_t i = 0; i < count; ++i) {
		times.push_back(initial_timestamp + interval * static_cast<std::int64_t>(i));
	}
	return times;
}

inline std::vector<TimePoint> initialTimes(const TimePoint &initial_timestamp, std::size_t count,
                                           const Period &interval) {
	return initialTimes(initial_timestamp, count, interval.duration());
}

/**
 * @class WindowedStore
 * @brief Ordered mapping from window-start timestamp to a forecast window.
 *
 * All windows share one length (the horizon) and window starts are evenly spaced.
 * Both properties are checked once at construction; the store is immutable afterwards.
 */
template <typename Element>
class WindowedStore {
public:
	using element_type = Element;
	using Window = std::vector<Element>;
	using Map = std::map<TimePoint, Window>;
	using const_iterator = typename Map::const_iterator;

	/**
	 * @class WindowRange
	 * @brief Lazy view over the (start, window) pairs of a store in ascending order.
	 *
	 * The range holds no cursor of its own; every call to begin() starts over.
	 */
	class WindowRange {
	public:
		explicit WindowRange(const Map &windows) : windows_(&windows) {
		}

		const_iterator begin() const {
			return windows_->cbegin();
		}
		const_iterator end() const {
			return windows_->cend();
		}
		std::size_t size() const {
			return windows_->size();
		}
		bool empty() const {
			return windows_->empty();
		}

	private:
		const Map *windows_;
	};

	WindowedStore() = default;

	/**
	 * @throws DataFormatError If windows differ in length or window starts are not evenly spaced.
	 */
	explicit WindowedStore(Map windows) : windows_(std::move(windows)) {
		validate();
	}

	static constexpr PayloadKind kind() {
		return PayloadTraits<Element>::kind;
	}

	std::size_t count() const {
		return windows_.size();
	}

	bool empty() const {
		return windows_.empty();
	}

	std::size_t horizon() const {
		return windows_.empty() ? 0 : windows_.begin()->second.size();
	}

	/// Spacing between consecutive window starts; zero when count() <= 1.
	Duration interval() const {
		if (windows_.size() < 2) {
			return Duration::zero();
		}
		auto it = windows_.begin();
		const auto first = it->first;
		++it;
		return elapsed(first, it->first);
	}

	/**
	 * @throws std::out_of_range If the store holds no windows.
	 */
	TimePoint initialTimestamp() const {
		if (windows_.empty()) {
			throw std::out_of_range("Windowed store holds no forecast windows.");
		}
		return windows_.begin()->first;
	}

	std::vector<TimePoint> initialTimes() const {
		if (windows_.empty()) {
			return {};
		}
		return core::initialTimes(initialTimestamp(), count(), interval());
	}

	bool contains(const TimePoint &start_time) const {
		return windows_.find(start_time) != windows_.end();
	}

	/**
	 * @throws std::invalid_argument If @p start_time is not a window start.
	 */
	const Window &at(const TimePoint &start_time) const {
		const auto it = windows_.find(start_time);
		if (it == windows_.end()) {
			throw std::invalid_argument("No forecast window starts at " + formatTimestamp(start_time) + ".");
		}
		return it->second;
	}

	/**
	 * @brief Returns the window starting at @p start_time.
	 * @param len When given and not larger than the horizon, the window is truncated to its
	 *            first @p len entries.
	 */
	Window window(const TimePoint &start_time, std::optional<std::size_t> len = std::nullopt) const {
		const auto &full = at(start_time);
		if (len && *len <= full.size()) {
			return Window(full.begin(), full.begin() + static_cast<std::ptrdiff_t>(*len));
		}
		return full;
	}

	WindowRange windows() const {
		return WindowRange(windows_);
	}

	const_iterator begin() const {
		return windows_.cbegin();
	}
	const_iterator end() const {
		return windows_.cend();
	}

	const Map &data() const {
		return windows_;
	}

	/// Applies @p fn to every element, keeping keys and window layout.
	template <typename Fn>
	auto transformed(Fn &&fn) const -> WindowedStore<std::decay_t<decltype(fn(std::declval<const Element &>()))>> {
		using Result = std::decay_t<decltype(fn(std::declval<const Element &>()))>;
		typename WindowedStore<Result>::Map result;
		for (const auto &entry : windows_) {
			std::vector<Result> window;
			window.reserve(entry.second.size());
			for (const auto &element : entry.second) {
				window.push_back(fn(element));
			}
			result.emplace(entry.first, std::move(window));
		}
		return WindowedStore<Result>(std::move(result));
	}

	/**
	 * @brief Copies the windows starting at @p start_times into a new store.
	 * @throws std::invalid_argument If a requested start is not a window start or the selected
	 *         starts are not evenly spaced.
	 */
	WindowedStore subset(const std::vector<TimePoint> &start_times) const {
		Map selected;
		for (const auto &start : start_times) {
			selected.emplace(start, at(start));
		}
		if (selected.size() > 2) {
			const auto step = elapsed(selected.begin()->first, std::next(selected.begin())->first);
			auto previous = selected.begin();
			for (auto it = std::next(previous); it != selected.end(); previous = it, ++it) {
				if (elapsed(previous->first, it->first) != step) {
					throw std::invalid_argument("Selected window starts are not evenly spaced: " +
					                            formatTimestamp(it->first) + " does not follow " +
					                            formatTimestamp(previous->first) + " by " +
					                            std::to_string(step.count()) + " ms.");
				}
			}
		}
		return WindowedStore(std::move(selected));
	}

	bool operator==(const WindowedStore &other) const {
		return windows_ == other.windows_;
	}
	bool operator!=(const WindowedStore &other) const {
		return !(*this == other);
	}

private:
	void validate() const {
		if (windows_.empty()) {
			return;
		}
		const auto expected_horizon = horizon();
		for (const auto &entry : windows_) {
			if (entry.second.size() != expected_horizon) {
				throw DataFormatError("Forecast window at " + formatTimestamp(entry.first) + " has length " +
				                      std::to_string(entry.second.size()) + ", expected horizon " +
				                      std::to_string(expected_horizon) + ".");
			}
		}
		const auto expected_interval = interval();
		auto previous = windows_.begin();
		for (auto it = std::next(previous); it != windows_.end(); previous = it, ++it) {
			if (elapsed(previous->first, it->first) != expected_interval) {
				throw DataFormatError("Forecast window starts are not evenly spaced: " +
				                      formatTimestamp(it->first) + " breaks the interval of " +
				                      std::to_string(expected_interval.count()) + " ms.");
			}
		}
	}

	Map windows_;
};

using ConstantStore = WindowedStore<double>;
using PolynomialStore = WindowedStore<Polynomial>;
using PiecewiseLinearStore = WindowedStore<PiecewiseLinear>;
using PiecewiseStepStore = WindowedStore<PiecewiseStep>;
using RowStore = WindowedStore<Row>;

} // namespace fcaststore::core
