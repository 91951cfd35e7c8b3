#include "fcast-store/core/payload.hpp"

#include <stdexcept>

namespace fcaststore::core {

std::string toString(PayloadKind kind) {
	switch (kind) {
	case PayloadKind::Constant:
		return "Constant";
	case PayloadKind::Polynomial:
		return "Polynomial";
	case PayloadKind::PiecewiseLinear:
		return "PiecewiseLinear";
	case PayloadKind::PiecewiseStep:
		return "PiecewiseStep";
	case PayloadKind::Row:
		return "Row";
	}
	return "Unknown";
}

Polynomial::Polynomial(std::vector<double> coefficients) : coefficients_(std::move(coefficients)) {
	if (coefficients_.size() < kMinDegree || coefficients_.size() > kMaxDegree) {
		throw std::invalid_argument("Polynomial data must have 2 (linear) or 3 (quadratic) coefficients, got " +
		                            std::to_string(coefficients_.size()) + ".");
	}
}

Polynomial Polynomial::scaled(double divisor) const {
	std::vector<double> scaled;
	scaled.reserve(coefficients_.size());
	for (double c : coefficients_) {
		scaled.push_back(c / divisor);
	}
	return Polynomial(std::move(scaled));
}

PiecewiseLinear PiecewiseLinear::fromRawPoints(const std::vector<std::vector<double>> &points) {
	std::vector<XYPoint> converted;
	converted.reserve(points.size());
	for (std::size_t i = 0; i < points.size(); ++i) {
		if (points[i].size() != 2) {
			throw std::invalid_argument("Piecewise point " + std::to_string(i) + " has " +
			                            std::to_string(points[i].size()) +
			                            " components; each point must be exactly (x, y).");
		}
		converted.push_back(XYPoint{points[i][0], points[i][1]});
	}
	return PiecewiseLinear(std::move(converted));
}

PiecewiseLinear PiecewiseLinear::scaled(double divisor) const {
	std::vector<XYPoint> scaled;
	scaled.reserve(points_.size());
	for (const auto &point : points_) {
		scaled.push_back(XYPoint{point.x, point.y / divisor});
	}
	return PiecewiseLinear(std::move(scaled));
}

PiecewiseStep::PiecewiseStep(std::vector<double> x_coords, std::vector<double> y_coords)
    : x_coords_(std::move(x_coords)), y_coords_(std::move(y_coords)) {
	if (x_coords_.size() != y_coords_.size() + 1) {
		throw std::invalid_argument("Piecewise step data needs one more x breakpoint than y levels.");
	}
}

PiecewiseStep PiecewiseStep::scaled(double divisor) const {
	std::vector<double> y_scaled;
	y_scaled.reserve(y_coords_.size());
	for (double y : y_coords_) {
		y_scaled.push_back(y / divisor);
	}
	return PiecewiseStep(x_coords_, std::move(y_scaled));
}

} // namespace fcaststore::core
