#include <catch2/catch.hpp>

#include "fcast-store/core/payload.hpp"

#include <stdexcept>

using fcaststore::core::PiecewiseLinear;
using fcaststore::core::PiecewiseStep;
using fcaststore::core::Polynomial;
using fcaststore::core::XYPoint;

TEST_CASE("Polynomial accepts linear and quadratic coefficients only", "[core][payload][polynomial]") {
	REQUIRE(Polynomial::linear(2.0, 1.0).degree() == 2);
	REQUIRE(Polynomial::quadratic(0.5, 2.0, 1.0).degree() == 3);
	REQUIRE_THROWS_AS(Polynomial({1.0}), std::invalid_argument);
	REQUIRE_THROWS_AS(Polynomial({1.0, 2.0, 3.0, 4.0}), std::invalid_argument);
}

TEST_CASE("Polynomial scaling divides every coefficient", "[core][payload][polynomial]") {
	const auto scaled = Polynomial::quadratic(4.0, 2.0, 1.0).scaled(2.0);
	REQUIRE(scaled.coefficients()[0] == Catch::Detail::Approx(2.0));
	REQUIRE(scaled.coefficients()[1] == Catch::Detail::Approx(1.0));
	REQUIRE(scaled.coefficients()[2] == Catch::Detail::Approx(0.5));
}

TEST_CASE("PiecewiseLinear requires (x, y) pairs", "[core][payload][piecewise]") {
	const auto curve = PiecewiseLinear::fromRawPoints({{0.0, 1.0}, {10.0, 3.0}});
	REQUIRE(curve.pointCount() == 2);
	REQUIRE(curve.points()[1] == XYPoint{10.0, 3.0});

	REQUIRE_THROWS_AS(PiecewiseLinear::fromRawPoints({{0.0, 1.0}, {10.0, 3.0, 4.0}}), std::invalid_argument);
	REQUIRE_THROWS_AS(PiecewiseLinear::fromRawPoints({{0.0}}), std::invalid_argument);
}

TEST_CASE("Curve scaling only touches y values", "[core][payload][piecewise]") {
	const auto curve = PiecewiseLinear({{0.0, 2.0}, {10.0, 6.0}}).scaled(2.0);
	REQUIRE(curve.points()[0] == XYPoint{0.0, 1.0});
	REQUIRE(curve.points()[1] == XYPoint{10.0, 3.0});

	const auto step = PiecewiseStep({0.0, 5.0, 10.0}, {4.0, 8.0}).scaled(4.0);
	REQUIRE(step.xCoords() == std::vector<double>{0.0, 5.0, 10.0});
	REQUIRE(step.yCoords() == std::vector<double>{1.0, 2.0});
}

TEST_CASE("PiecewiseStep needs one more breakpoint than levels", "[core][payload][piecewise]") {
	REQUIRE_NOTHROW(PiecewiseStep({0.0, 1.0}, {3.0}));
	REQUIRE_THROWS_AS(PiecewiseStep({0.0, 1.0}, {3.0, 4.0}), std::invalid_argument);
}

TEST_CASE("Payload kinds have readable names", "[core][payload]") {
	using fcaststore::core::PayloadKind;
	REQUIRE(fcaststore::core::toString(PayloadKind::Constant) == "Constant");
	REQUIRE(fcaststore::core::toString(PayloadKind::PiecewiseLinear) == "PiecewiseLinear");
	REQUIRE(fcaststore::core::toString(PayloadKind::PiecewiseStep) == "PiecewiseStep");
}
