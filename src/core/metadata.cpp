#include "fcast-store/core/metadata.hpp"

#include <algorithm>
#include <cctype>
#include <random>
#include <stdexcept>

namespace fcaststore::core {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int hexValue(char c) {
	if (c >= '0' && c <= '9') {
		return c - '0';
	}
	const auto lower = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	if (lower >= 'a' && lower <= 'f') {
		return lower - 'a' + 10;
	}
	return -1;
}

bool isDashPosition(std::size_t index) {
	return index == 8 || index == 13 || index == 18 || index == 23;
}

} // namespace

std::string toString(SeriesKind kind) {
	switch (kind) {
	case SeriesKind::Deterministic:
		return "Deterministic";
	case SeriesKind::Probabilistic:
		return "Probabilistic";
	case SeriesKind::Scenarios:
		return "Scenarios";
	case SeriesKind::SingleTimeSeries:
		return "SingleTimeSeries";
	}
	return "Unknown";
}

PayloadId PayloadId::generate() {
	thread_local std::mt19937_64 engine{std::random_device{}()};
	std::uniform_int_distribution<std::uint64_t> dist;

	Bytes bytes{};
	for (std::size_t half = 0; half < 2; ++half) {
		auto word = dist(engine);
		for (std::size_t i = 0; i < 8; ++i) {
			bytes[half * 8 + i] = static_cast<std::uint8_t>(word & 0xFFu);
			word >>= 8;
		}
	}
	// RFC 4122 version 4, variant 1.
	bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0Fu) | 0x40u);
	bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3Fu) | 0x80u);
	return PayloadId(bytes);
}

PayloadId PayloadId::parse(const std::string &text) {
	if (text.size() != 36) {
		throw std::invalid_argument("Payload id '" + text + "' must have 36 characters.");
	}
	Bytes bytes{};
	std::size_t byte_index = 0;
	for (std::size_t i = 0; i < text.size();) {
		if (isDashPosition(i)) {
			if (text[i] != '-') {
				throw std::invalid_argument("Payload id '" + text + "' is missing a separator.");
			}
			++i;
			continue;
		}
		const int high = hexValue(text[i]);
		const int low = hexValue(text[i + 1]);
		if (high < 0 || low < 0 || isDashPosition(i + 1)) {
			throw std::invalid_argument("Payload id '" + text + "' contains a non-hex character.");
		}
		bytes[byte_index++] = static_cast<std::uint8_t>((high << 4) | low);
		i += 2;
	}
	return PayloadId(bytes);
}

bool PayloadId::isNil() const {
	return std::all_of(bytes_.begin(), bytes_.end(), [](std::uint8_t b) { return b == 0; });
}

std::string PayloadId::toString() const {
	std::string text;
	text.reserve(36);
	for (std::size_t i = 0; i < bytes_.size(); ++i) {
		if (i == 4 || i == 6 || i == 8 || i == 10) {
			text.push_back('-');
		}
		text.push_back(kHexDigits[bytes_[i] >> 4]);
		text.push_back(kHexDigits[bytes_[i] & 0x0F]);
	}
	return text;
}

} // namespace fcaststore::core
