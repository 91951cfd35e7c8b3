#include <catch2/catch.hpp>

#include "common/forecast_helpers.hpp"
#include "fcast-store/core/array_shaping.hpp"
#include "fcast-store/core/errors.hpp"

#include <chrono>
#include <stdexcept>
#include <string>
#include <utility>

using fcaststore::core::ConstantStore;
using fcaststore::core::DenseArray;
using fcaststore::core::NotImplementedError;
using fcaststore::core::PiecewiseLinear;
using fcaststore::core::PiecewiseLinearStore;
using fcaststore::core::PiecewiseStep;
using fcaststore::core::PiecewiseStepStore;
using fcaststore::core::Polynomial;
using fcaststore::core::PolynomialStore;
using fcaststore::core::SeriesData;
using fcaststore::core::shapeForStorage;
using fcaststore::core::WindowData;
using tests::helpers::epoch2020;

namespace {

PiecewiseLinear ramp(std::size_t points, double offset) {
	std::vector<fcaststore::core::XYPoint> xy;
	for (std::size_t p = 0; p < points; ++p) {
		xy.push_back({static_cast<double>(p), offset + static_cast<double>(p)});
	}
	return PiecewiseLinear(std::move(xy));
}

} // namespace

TEST_CASE("DenseArray validates its buffer against the shape", "[core][array_shaping][dense_array]") {
	REQUIRE_NOTHROW(DenseArray({2, 3}, std::vector<double>(6, 1.0)));
	REQUIRE_THROWS_AS(DenseArray({2, 3}, std::vector<double>(5, 1.0)), std::invalid_argument);

	DenseArray zeros(DenseArray::Shape{2, 2});
	REQUIRE(zeros.size() == 4);
	zeros.at({1, 0}) = 7.0;
	REQUIRE(zeros.values()[2] == 7.0);
	REQUIRE_THROWS_AS(zeros.at({2, 0}), std::out_of_range);
	REQUIRE_THROWS_AS(zeros.at({0}), std::out_of_range);
	REQUIRE(zeros.shapeString() == "[2, 2]");
}

TEST_CASE("Constant stores shape to [horizon, count] with one column per window", "[core][array_shaping]") {
	const SeriesData data = tests::helpers::makeConstantStore(3, 4);
	const auto array = shapeForStorage(data);

	REQUIRE(array.shape() == DenseArray::Shape{4, 3});
	for (std::size_t j = 0; j < 3; ++j) {
		for (std::size_t r = 0; r < 4; ++r) {
			REQUIRE(array.at({r, j}) == Catch::Detail::Approx(10.0 * static_cast<double>(j) + static_cast<double>(r)));
		}
	}

	const auto matrix = array.asMatrix();
	REQUIRE(matrix.rows() == 4);
	REQUIRE(matrix.cols() == 3);
	REQUIRE(matrix(3, 2) == Catch::Detail::Approx(23.0));
}

TEST_CASE("A constant window shapes to [horizon]", "[core][array_shaping]") {
	const WindowData window = std::vector<double>{1.0, 2.0, 3.0};
	const auto array = shapeForStorage(window);
	REQUIRE(array.shape() == DenseArray::Shape{3});
	REQUIRE(array.values() == std::vector<double>{1.0, 2.0, 3.0});
	REQUIRE_THROWS_AS(array.asMatrix(), std::logic_error);
}

TEST_CASE("Polynomial payloads gain a degree dimension", "[core][array_shaping][polynomial]") {
	const auto t0 = epoch2020();
	PolynomialStore::Map windows;
	windows.emplace(t0, std::vector<Polynomial>{Polynomial::linear(1.0, 2.0), Polynomial::linear(3.0, 4.0)});
	windows.emplace(t0 + std::chrono::hours{1},
	                std::vector<Polynomial>{Polynomial::linear(5.0, 6.0), Polynomial::linear(7.0, 8.0)});
	const SeriesData data = PolynomialStore(std::move(windows));

	const auto array = shapeForStorage(data);
	REQUIRE(array.shape() == DenseArray::Shape{2, 2, 2});
	REQUIRE(array.at({0, 1, 0}) == 5.0);
	REQUIRE(array.at({1, 0, 1}) == 4.0);

	const WindowData window = std::vector<Polynomial>{Polynomial::quadratic(1.0, 2.0, 3.0)};
	REQUIRE(shapeForStorage(window).shape() == DenseArray::Shape{1, 3});
}

TEST_CASE("Mixed polynomial degrees are rejected", "[core][array_shaping][polynomial]") {
	const WindowData window =
	    std::vector<Polynomial>{Polynomial::linear(1.0, 2.0), Polynomial::quadratic(1.0, 2.0, 3.0)};
	REQUIRE_THROWS_AS(shapeForStorage(window), std::invalid_argument);
}

TEST_CASE("PiecewiseLinear payloads shape to points and coordinates", "[core][array_shaping][piecewise]") {
	const auto t0 = epoch2020();
	PiecewiseLinearStore::Map windows;
	windows.emplace(t0, std::vector<PiecewiseLinear>{ramp(3, 0.0), ramp(3, 10.0)});
	windows.emplace(t0 + std::chrono::hours{1}, std::vector<PiecewiseLinear>{ramp(3, 20.0), ramp(3, 30.0)});
	const SeriesData data = PiecewiseLinearStore(std::move(windows));

	const auto array = shapeForStorage(data);
	REQUIRE(array.shape() == DenseArray::Shape{2, 2, 3, 2});
	REQUIRE(array.at({1, 0, 2, 0}) == 2.0);
	REQUIRE(array.at({1, 1, 2, 1}) == 32.0);

	const WindowData window = std::vector<PiecewiseLinear>{ramp(4, 0.0)};
	REQUIRE(shapeForStorage(window).shape() == DenseArray::Shape{1, 4, 2});
}

TEST_CASE("Curves with different point counts are rejected", "[core][array_shaping][piecewise]") {
	const auto t0 = epoch2020();

	SECTION("within one window") {
		const WindowData window = std::vector<PiecewiseLinear>{ramp(3, 0.0), ramp(4, 0.0)};
		REQUIRE_THROWS_AS(shapeForStorage(window), std::invalid_argument);
	}
	SECTION("one timestep of the store") {
		PiecewiseLinearStore::Map windows;
		windows.emplace(t0, std::vector<PiecewiseLinear>{ramp(4, 0.0), ramp(4, 1.0)});
		windows.emplace(t0 + std::chrono::hours{1}, std::vector<PiecewiseLinear>{ramp(4, 2.0), ramp(3, 3.0)});
		const SeriesData data = PiecewiseLinearStore(std::move(windows));
		REQUIRE_THROWS_AS(shapeForStorage(data), std::invalid_argument);
		try {
			shapeForStorage(data);
		} catch (const std::invalid_argument &error) {
			REQUIRE(std::string(error.what()).find("point count") != std::string::npos);
		}
	}
}

TEST_CASE("Step curves are not implemented by the shaping engine", "[core][array_shaping]") {
	PiecewiseStepStore::Map windows;
	windows.emplace(epoch2020(), std::vector<PiecewiseStep>{PiecewiseStep({0.0, 1.0}, {2.0})});
	const SeriesData data = PiecewiseStepStore(std::move(windows));

	REQUIRE_THROWS_AS(shapeForStorage(data), NotImplementedError);
	try {
		shapeForStorage(data);
	} catch (const NotImplementedError &error) {
		REQUIRE(std::string(error.what()) == "shapeForStorage not currently implemented for PiecewiseStep payloads");
	}
}

TEST_CASE("Row stores shape to [horizon, count, components]", "[core][array_shaping][rows]") {
	const auto t0 = epoch2020();
	fcaststore::core::RowStore::Map windows;
	windows.emplace(t0, std::vector<fcaststore::core::Row>{{1.0, 2.0, 3.0}, {4.0, 5.0, 6.0}});
	windows.emplace(t0 + std::chrono::hours{1}, std::vector<fcaststore::core::Row>{{7.0, 8.0, 9.0}, {10.0, 11.0, 12.0}});

	const auto array = shapeForStorage(fcaststore::core::RowStore(std::move(windows)));
	REQUIRE(array.shape() == DenseArray::Shape{2, 2, 3});
	REQUIRE(array.at({1, 1, 2}) == 12.0);
	REQUIRE(array.at({0, 1, 0}) == 7.0);
}

TEST_CASE("Empty stores shape to empty arrays", "[core][array_shaping]") {
	const SeriesData data = ConstantStore();
	const auto array = shapeForStorage(data);
	REQUIRE(array.shape() == DenseArray::Shape{0, 0});
	REQUIRE(array.size() == 0);
}
