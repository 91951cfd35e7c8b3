#include "fcast-store/core/raw_series.hpp"

#include "fcast-store/core/errors.hpp"
#include "fcast-store/utils/logging.hpp"

#include <optional>
#include <string>

namespace fcaststore::core {

namespace {

const char *rawShapeName(const RawValue &value) {
	switch (value.index()) {
	case 0:
		return "number";
	case 1:
		return "tuple";
	default:
		return "curve";
	}
}

const RawValue *firstElement(const RawTimeSeries &raw) {
	for (const auto &entry : raw) {
		if (!entry.second.empty()) {
			return &entry.second.front();
		}
	}
	return nullptr;
}

void requireShape(const RawValue &value, const RawValue &reference, const TimePoint &start) {
	if (value.index() != reference.index()) {
		throw DataFormatError("Mixed payload shapes in forecast window at " + formatTimestamp(start) + ": found a " +
		                      rawShapeName(value) + " where a " + rawShapeName(reference) + " was expected.");
	}
}

ConstantStore convertConstant(const RawTimeSeries &raw) {
	const auto &reference = *firstElement(raw);
	ConstantStore::Map windows;
	for (const auto &entry : raw) {
		std::vector<double> window;
		window.reserve(entry.second.size());
		for (const auto &value : entry.second) {
			requireShape(value, reference, entry.first);
			window.push_back(std::get<double>(value));
		}
		windows.emplace(entry.first, std::move(window));
	}
	return ConstantStore(std::move(windows));
}

PolynomialStore convertPolynomial(const RawTimeSeries &raw) {
	const auto &reference = *firstElement(raw);
	const auto degree = std::get<RawTuple>(reference).values.size();
	if (degree < Polynomial::kMinDegree || degree > Polynomial::kMaxDegree) {
		throw DataFormatError("Tuple payloads must have 2 or 3 components, found " + std::to_string(degree) + ".");
	}
	PolynomialStore::Map windows;
	for (const auto &entry : raw) {
		std::vector<Polynomial> window;
		window.reserve(entry.second.size());
		for (const auto &value : entry.second) {
			requireShape(value, reference, entry.first);
			const auto &tuple = std::get<RawTuple>(value);
			if (tuple.values.size() != degree) {
				throw DataFormatError("Mixed tuple arity in forecast window at " + formatTimestamp(entry.first) +
				                      ": found " + std::to_string(tuple.values.size()) + " components, expected " +
				                      std::to_string(degree) + ".");
			}
			window.emplace_back(tuple.values);
		}
		windows.emplace(entry.first, std::move(window));
	}
	return PolynomialStore(std::move(windows));
}

PiecewiseLinearStore convertPiecewise(const RawTimeSeries &raw) {
	const auto &reference = *firstElement(raw);
	PiecewiseLinearStore::Map windows;
	for (const auto &entry : raw) {
		std::vector<PiecewiseLinear> window;
		window.reserve(entry.second.size());
		for (const auto &value : entry.second) {
			requireShape(value, reference, entry.first);
			const auto &curve = std::get<RawCurve>(value);
			for (const auto &point : curve.points) {
				if (point.size() != 2) {
					throw DataFormatError("Curve point in forecast window at " + formatTimestamp(entry.first) +
					                      " has " + std::to_string(point.size()) +
					                      " components; curves must be sequences of (x, y) pairs.");
				}
			}
			window.push_back(PiecewiseLinear::fromRawPoints(curve.points));
		}
		windows.emplace(entry.first, std::move(window));
	}
	return PiecewiseLinearStore(std::move(windows));
}

} // namespace

SeriesData classifyPayload(const RawTimeSeries &raw, PayloadInference inference) {
	const auto *reference = firstElement(raw);
	if (reference == nullptr) {
		if (inference != PayloadInference::AssumeConstant) {
			throw DataFormatError("Cannot infer the payload type of a forecast mapping without values; "
			                      "request PayloadInference::AssumeConstant to treat it as constant data.");
		}
		// Only the shape is assumed here; there are no values to inspect.
		FCAST_DEBUG("Assuming a constant payload for a mapping with {} empty windows.", raw.size());
		ConstantStore::Map windows;
		for (const auto &entry : raw) {
			windows.emplace(entry.first, std::vector<double>{});
		}
		return ConstantStore(std::move(windows));
	}

	switch (reference->index()) {
	case 0:
		return convertConstant(raw);
	case 1:
		return convertPolynomial(raw);
	default:
		return convertPiecewise(raw);
	}
}

RawTimeSeries toRawTimeSeries(const std::map<TimePoint, std::vector<double>> &values) {
	RawTimeSeries raw;
	for (const auto &entry : values) {
		std::vector<RawValue> window(entry.second.begin(), entry.second.end());
		raw.emplace(entry.first, std::move(window));
	}
	return raw;
}

} // namespace fcaststore::core
