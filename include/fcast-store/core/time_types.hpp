#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace fcaststore::core {

using TimePoint = std::chrono::system_clock::time_point;

/// Difference between two timestamps, millisecond precision.
using Duration = std::chrono::milliseconds;

/**
 * @struct Period
 * @brief A calendar-free duration expressed as a count of a single unit.
 *
 * Two periods compare equal when they span the same duration, so
 * Period::hours(24) == Period::days(1).
 */
struct Period {
	enum class Unit { Millisecond, Second, Minute, Hour, Day };

	std::int64_t count = 0;
	Unit unit = Unit::Millisecond;

	static Period milliseconds(std::int64_t n) {
		return Period{n, Unit::Millisecond};
	}
	static Period seconds(std::int64_t n) {
		return Period{n, Unit::Second};
	}
	static Period minutes(std::int64_t n) {
		return Period{n, Unit::Minute};
	}
	static Period hours(std::int64_t n) {
		return Period{n, Unit::Hour};
	}
	static Period days(std::int64_t n) {
		return Period{n, Unit::Day};
	}

	/// Length of one unit in milliseconds.
	static std::int64_t unitMilliseconds(Unit unit);

	Duration duration() const {
		return Duration(count * unitMilliseconds(unit));
	}

	bool isZero() const {
		return count == 0;
	}

	Period operator*(std::int64_t factor) const {
		return Period{count * factor, unit};
	}

	bool operator==(const Period &other) const {
		return duration() == other.duration();
	}

	bool operator!=(const Period &other) const {
		return !(*this == other);
	}

	/// Human readable form, e.g. "15 minutes" or "1 hour".
	std::string toString() const;
};

inline TimePoint operator+(const TimePoint &tp, const Period &period) {
	return tp + period.duration();
}

inline TimePoint operator-(const TimePoint &tp, const Period &period) {
	return tp - period.duration();
}

/// Millisecond difference @p to - @p from.
inline Duration elapsed(const TimePoint &from, const TimePoint &to) {
	return std::chrono::duration_cast<Duration>(to - from);
}

/**
 * @brief Parses an ISO-8601 style UTC timestamp.
 *
 * Accepts "YYYY-MM-DDTHH:MM:SS", a space instead of 'T', and an optional
 * ".mmm" millisecond suffix.
 * @throws DataFormatError If the text is not a timestamp.
 */
TimePoint parseTimestamp(const std::string &text);

/// Formats a timestamp as "YYYY-MM-DDTHH:MM:SS" (UTC), with ".mmm" when needed.
std::string formatTimestamp(const TimePoint &tp);

} // namespace fcaststore::core
