#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace fcaststore::core {

/// Element kinds a single timestep of a forecast window can hold.
enum class PayloadKind {
	Constant,
	Polynomial,
	PiecewiseLinear,
	PiecewiseStep,
	Row
};

std::string toString(PayloadKind kind);

/**
 * @class Polynomial
 * @brief Fixed-length tuple of cost-style coefficients.
 *
 * The degree is the tuple length: 2 for linear data (proportional, constant),
 * 3 for quadratic data (quadratic, proportional, constant).
 */
class Polynomial {
public:
	static constexpr std::size_t kMinDegree = 2;
	static constexpr std::size_t kMaxDegree = 3;

	/**
	 * @throws std::invalid_argument If the coefficient count is not 2 or 3.
	 */
	explicit Polynomial(std::vector<double> coefficients);

	static Polynomial linear(double proportional, double constant) {
		return Polynomial({proportional, constant});
	}

	static Polynomial quadratic(double quadratic, double proportional, double constant) {
		return Polynomial({quadratic, proportional, constant});
	}

	std::size_t degree() const {
		return coefficients_.size();
	}

	const std::vector<double> &coefficients() const {
		return coefficients_;
	}

	Polynomial scaled(double divisor) const;

	bool operator==(const Polynomial &other) const {
		return coefficients_ == other.coefficients_;
	}
	bool operator!=(const Polynomial &other) const {
		return !(*this == other);
	}

private:
	std::vector<double> coefficients_;
};

struct XYPoint {
	double x = 0.0;
	double y = 0.0;

	bool operator==(const XYPoint &other) const {
		return x == other.x && y == other.y;
	}
	bool operator!=(const XYPoint &other) const {
		return !(*this == other);
	}
};

/**
 * @class PiecewiseLinear
 * @brief Breakpoint curve given as an ordered sequence of (x, y) points.
 */
class PiecewiseLinear {
public:
	PiecewiseLinear() = default;
	explicit PiecewiseLinear(std::vector<XYPoint> points) : points_(std::move(points)) {
	}

	/**
	 * @brief Builds a curve from raw points, each of which must hold exactly two values.
	 * @throws std::invalid_argument If a point does not have exactly two components.
	 */
	static PiecewiseLinear fromRawPoints(const std::vector<std::vector<double>> &points);

	std::size_t pointCount() const {
		return points_.size();
	}

	const std::vector<XYPoint> &points() const {
		return points_;
	}

	/// Divides every y value by @p divisor; x breakpoints are left untouched.
	PiecewiseLinear scaled(double divisor) const;

	bool operator==(const PiecewiseLinear &other) const {
		return points_ == other.points_;
	}
	bool operator!=(const PiecewiseLinear &other) const {
		return !(*this == other);
	}

private:
	std::vector<XYPoint> points_;
};

/**
 * @class PiecewiseStep
 * @brief Step curve with n + 1 x breakpoints and n y levels.
 */
class PiecewiseStep {
public:
	/**
	 * @throws std::invalid_argument If x_coords.size() != y_coords.size() + 1.
	 */
	PiecewiseStep(std::vector<double> x_coords, std::vector<double> y_coords);

	const std::vector<double> &xCoords() const {
		return x_coords_;
	}
	const std::vector<double> &yCoords() const {
		return y_coords_;
	}

	PiecewiseStep scaled(double divisor) const;

	bool operator==(const PiecewiseStep &other) const {
		return x_coords_ == other.x_coords_ && y_coords_ == other.y_coords_;
	}
	bool operator!=(const PiecewiseStep &other) const {
		return !(*this == other);
	}

private:
	std::vector<double> x_coords_;
	std::vector<double> y_coords_;
};

/// One timestep of a Probabilistic or Scenarios window: one value per percentile/scenario.
using Row = std::vector<double>;

template <typename Element>
struct PayloadTraits;

template <>
struct PayloadTraits<double> {
	static constexpr PayloadKind kind = PayloadKind::Constant;
};

template <>
struct PayloadTraits<Polynomial> {
	static constexpr PayloadKind kind = PayloadKind::Polynomial;
};

template <>
struct PayloadTraits<PiecewiseLinear> {
	static constexpr PayloadKind kind = PayloadKind::PiecewiseLinear;
};

template <>
struct PayloadTraits<PiecewiseStep> {
	static constexpr PayloadKind kind = PayloadKind::PiecewiseStep;
};

template <>
struct PayloadTraits<Row> {
	static constexpr PayloadKind kind = PayloadKind::Row;
};

/// Divides the numeric content of one element by @p divisor.
inline double scaleElement(double value, double divisor) {
	return value / divisor;
}
inline Polynomial scaleElement(const Polynomial &value, double divisor) {
	return value.scaled(divisor);
}
inline PiecewiseLinear scaleElement(const PiecewiseLinear &value, double divisor) {
	return value.scaled(divisor);
}
inline PiecewiseStep scaleElement(const PiecewiseStep &value, double divisor) {
	return value.scaled(divisor);
}
inline Row scaleElement(const Row &value, double divisor) {
	Row scaled;
	scaled.reserve(value.size());
	for (double v : value) {
		scaled.push_back(v / divisor);
	}
	return scaled;
}

} // namespace fcaststore::core
