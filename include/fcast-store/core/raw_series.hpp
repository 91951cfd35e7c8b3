#pragma once

#include "fcast-store/core/series_data.hpp"
#include "fcast-store/core/time_types.hpp"

#include <map>
#include <variant>
#include <vector>

namespace fcaststore::core {

/// Fixed-arity tuple of numbers, e.g. (proportional, constant) cost coefficients.
struct RawTuple {
	std::vector<double> values;
};

/// Sequence of points, each expected to be an (x, y) pair.
struct RawCurve {
	std::vector<std::vector<double>> points;
};

/// One untyped timestep value as delivered by a reader or a caller.
using RawValue = std::variant<double, RawTuple, RawCurve>;

/// Untyped forecast input: window start -> raw window values.
using RawTimeSeries = std::map<TimePoint, std::vector<RawValue>>;

/**
 * @brief How to classify a raw mapping that carries no element at all.
 *
 * A mapping without windows, or whose windows are all empty, gives no structural
 * information about its payload. Strict rejects it; AssumeConstant treats it as a
 * Constant payload. The setting never affects input that does hold elements.
 */
enum class PayloadInference { Strict, AssumeConstant };

/**
 * @brief Classifies and converts a raw mapping into a typed windowed store.
 *
 * - all plain numbers -> Constant
 * - all tuples of one arity (2 or 3) -> Polynomial
 * - all sequences of (x, y) pairs -> PiecewiseLinear
 *
 * @throws DataFormatError If the values do not share one shape, or the mapping is empty
 *                         and @p inference is Strict.
 */
SeriesData classifyPayload(const RawTimeSeries &raw, PayloadInference inference = PayloadInference::Strict);

/// Convenience wrapper for input that is already plain numbers.
RawTimeSeries toRawTimeSeries(const std::map<TimePoint, std::vector<double>> &values);

} // namespace fcaststore::core
