#pragma once

#include "fcast-store/core/time_types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace fcaststore::core {

enum class SeriesKind { Deterministic, Probabilistic, Scenarios, SingleTimeSeries };

std::string toString(SeriesKind kind);

/**
 * @class PayloadId
 * @brief Random (version 4) UUID that identifies a stored payload.
 */
class PayloadId {
public:
	using Bytes = std::array<std::uint8_t, 16>;

	/// The all-zero id; never produced by generate().
	PayloadId() = default;
	explicit PayloadId(const Bytes &bytes) : bytes_(bytes) {
	}

	static PayloadId generate();

	/**
	 * @throws std::invalid_argument If @p text is not in 8-4-4-4-12 hex form.
	 */
	static PayloadId parse(const std::string &text);

	const Bytes &bytes() const {
		return bytes_;
	}

	bool isNil() const;

	std::string toString() const;

	bool operator==(const PayloadId &other) const {
		return bytes_ == other.bytes_;
	}
	bool operator!=(const PayloadId &other) const {
		return bytes_ != other.bytes_;
	}
	bool operator<(const PayloadId &other) const {
		return bytes_ < other.bytes_;
	}

private:
	Bytes bytes_{};
};

/// Free-form key/value tags distinguishing otherwise identical series (scenario, model year, ...).
using Features = std::map<std::string, std::string>;

/**
 * @struct SeriesMetadata
 * @brief Lightweight description of a series that can be indexed without its payload.
 */
struct SeriesMetadata {
	std::string name;
	SeriesKind kind = SeriesKind::Deterministic;
	Period resolution;
	TimePoint initial_timestamp{};
	Duration interval{0};
	std::size_t count = 0;
	std::size_t horizon = 0;
	PayloadId payload_id;
	/// Name of the transform the owning entity applies at read time; never applied here.
	std::optional<std::string> scaling_factor_multiplier;
	Features features;
	/// Percentile labels of a Probabilistic series.
	std::vector<double> percentiles;
	/// Scenario count of a Scenarios series.
	std::size_t scenario_count = 0;

	bool hasFeature(const std::string &key, const std::string &value) const {
		const auto it = features.find(key);
		return it != features.end() && it->second == value;
	}
};

} // namespace fcaststore::core
