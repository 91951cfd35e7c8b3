#include "fcast-store/core/time_types.hpp"

#include "fcast-store/core/errors.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace fcaststore::core {

namespace {

constexpr std::int64_t kMillisPerSecond = 1000LL;
constexpr std::int64_t kMillisPerMinute = 60LL * kMillisPerSecond;
constexpr std::int64_t kMillisPerHour = 60LL * kMillisPerMinute;
constexpr std::int64_t kMillisPerDay = 24LL * kMillisPerHour;

const char *unitName(Period::Unit unit) {
	switch (unit) {
	case Period::Unit::Millisecond:
		return "millisecond";
	case Period::Unit::Second:
		return "second";
	case Period::Unit::Minute:
		return "minute";
	case Period::Unit::Hour:
		return "hour";
	case Period::Unit::Day:
		return "day";
	}
	return "unit";
}

bool safeGmTime(std::time_t time_value, std::tm &out) {
#if defined(_WIN32)
	return gmtime_s(&out, &time_value) == 0;
#else
	return gmtime_r(&time_value, &out) != nullptr;
#endif
}

std::time_t toUtcSeconds(std::tm &tm) {
#if defined(_WIN32)
	return _mkgmtime(&tm);
#else
	return timegm(&tm);
#endif
}

} // namespace

std::int64_t Period::unitMilliseconds(Unit unit) {
	switch (unit) {
	case Unit::Millisecond:
		return 1;
	case Unit::Second:
		return kMillisPerSecond;
	case Unit::Minute:
		return kMillisPerMinute;
	case Unit::Hour:
		return kMillisPerHour;
	case Unit::Day:
		return kMillisPerDay;
	}
	throw std::logic_error("Unsupported period unit.");
}

std::string Period::toString() const {
	std::ostringstream out;
	out << count << ' ' << unitName(unit);
	if (count != 1) {
		out << 's';
	}
	return out.str();
}

TimePoint parseTimestamp(const std::string &text) {
	std::string normalized = text;
	const auto separator = normalized.find('T');
	if (separator != std::string::npos) {
		normalized[separator] = ' ';
	}

	std::int64_t millis = 0;
	const auto dot = normalized.find('.');
	if (dot != std::string::npos) {
		const auto fraction = normalized.substr(dot + 1);
		if (fraction.empty() || fraction.size() > 3 ||
		    fraction.find_first_not_of("0123456789") != std::string::npos) {
			throw DataFormatError("Invalid fractional seconds in timestamp '" + text + "'.");
		}
		millis = std::stoll(fraction);
		for (std::size_t i = fraction.size(); i < 3; ++i) {
			millis *= 10;
		}
		normalized.erase(dot);
	}

	std::tm tm{};
	std::istringstream in(normalized);
	in >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
	if (in.fail()) {
		throw DataFormatError("Cannot parse timestamp '" + text + "'.");
	}
	in >> std::ws;
	if (!in.eof()) {
		throw DataFormatError("Unexpected trailing characters in timestamp '" + text + "'.");
	}

	const auto seconds = toUtcSeconds(tm);
	return TimePoint{} + std::chrono::seconds(seconds) + Duration(millis);
}

std::string formatTimestamp(const TimePoint &tp) {
	const auto total_ms = std::chrono::duration_cast<Duration>(tp.time_since_epoch()).count();
	std::int64_t seconds = total_ms / kMillisPerSecond;
	std::int64_t millis = total_ms % kMillisPerSecond;
	if (millis < 0) {
		millis += kMillisPerSecond;
		--seconds;
	}

	std::tm tm{};
	if (!safeGmTime(static_cast<std::time_t>(seconds), tm)) {
		throw std::out_of_range("Timestamp is outside the representable calendar range.");
	}

	std::ostringstream out;
	out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
	if (millis != 0) {
		out << '.' << std::setw(3) << std::setfill('0') << millis;
	}
	return out.str();
}

} // namespace fcaststore::core
