#include <catch2/catch.hpp>

#include "common/forecast_helpers.hpp"
#include "fcast-store/core/errors.hpp"
#include "fcast-store/core/single_time_series.hpp"

#include <chrono>
#include <cstddef>
#include <limits>
#include <stdexcept>
#include <vector>

using fcaststore::core::DataFormatError;
using fcaststore::core::DenseArray;
using fcaststore::core::Duration;
using fcaststore::core::NotImplementedError;
using fcaststore::core::Period;
using fcaststore::core::Polynomial;
using fcaststore::core::SeriesBuildOptions;
using fcaststore::core::SeriesKind;
using fcaststore::core::SingleTimeSeries;
using fcaststore::core::TimeArray;
using fcaststore::core::TimePoint;
using fcaststore::core::WindowData;
using tests::helpers::epoch2020;
using tests::helpers::makeTimestamps;

TEST_CASE("SingleTimeSeries behaves as one window", "[core][single_time_series]") {
	const auto series = SingleTimeSeries::fromTimeArray(
	    "price", TimeArray(makeTimestamps(4, std::chrono::minutes{30}), {1.0, 2.0, 3.0, 4.0}));

	REQUIRE(series.kind() == SeriesKind::SingleTimeSeries);
	REQUIRE(series.resolution() == Period::minutes(30));
	REQUIRE(series.count() == 1);
	REQUIRE(series.horizon() == 4);
	REQUIRE(series.interval() == Duration::zero());
	REQUIRE(series.initialTimestamp() == epoch2020());
	REQUIRE(series.initialTimes() == std::vector<TimePoint>{epoch2020()});
	REQUIRE(series.timestamps() == makeTimestamps(4, std::chrono::minutes{30}));
	REQUIRE(series.totalPeriod() == std::chrono::minutes{90});
}

TEST_CASE("SingleTimeSeries exposes its trajectory as its only window", "[core][single_time_series][window]") {
	const SingleTimeSeries series("price", epoch2020(), Period::hours(1),
	                              WindowData(std::vector<double>{1.0, 2.0, 3.0}));

	REQUIRE(std::get<std::vector<double>>(series.getWindow(epoch2020())) == std::vector<double>{1.0, 2.0, 3.0});
	REQUIRE(std::get<std::vector<double>>(series.getWindow(epoch2020(), 2)) == std::vector<double>{1.0, 2.0});
	REQUIRE(std::get<std::vector<double>>(series.getWindow(epoch2020(), 10)).size() == 3);
	REQUIRE_THROWS_AS(series.getWindow(epoch2020() + std::chrono::hours{1}), std::invalid_argument);

	std::size_t visited = 0;
	for (const auto &entry : series.iterateWindows()) {
		REQUIRE(entry.first == epoch2020());
		REQUIRE(entry.second == series.data());
		++visited;
	}
	REQUIRE(visited == series.count());
}

TEST_CASE("SingleTimeSeries rejects unusable TimeArrays", "[core][single_time_series][validation]") {
	const auto wide = TimeArray(makeTimestamps(2), {{1.0, 2.0}, {3.0, 4.0}}, TimeArray::ValueLayout::ByColumn);
	REQUIRE_THROWS_AS(SingleTimeSeries::fromTimeArray("price", wide), std::invalid_argument);

	const auto t0 = epoch2020();
	const auto irregular =
	    TimeArray({t0, t0 + std::chrono::hours{1}, t0 + std::chrono::hours{3}}, std::vector<double>{1.0, 2.0, 3.0});
	REQUIRE_THROWS_AS(SingleTimeSeries::fromTimeArray("price", irregular), DataFormatError);

	REQUIRE_THROWS_AS(SingleTimeSeries("price", t0, Period::hours(1), WindowData(std::vector<double>{})),
	                  std::invalid_argument);
}

TEST_CASE("SingleTimeSeries normalizes and shapes its values", "[core][single_time_series]") {
	SeriesBuildOptions options;
	options.normalization_factor = 4.0;
	const SingleTimeSeries series("price", epoch2020(), Period::hours(1),
	                              WindowData(std::vector<double>{2.0, 4.0, 8.0}), options);

	REQUIRE(std::get<std::vector<double>>(series.data()) == std::vector<double>{0.5, 1.0, 2.0});
	const auto array = series.shapeForStorage();
	REQUIRE(array.shape() == DenseArray::Shape{3});
	REQUIRE(array.values() == std::vector<double>{0.5, 1.0, 2.0});

	const auto trajectory = series.toTimeArray();
	REQUIRE(trajectory.timestamps() == makeTimestamps(3));
	REQUIRE(trajectory.values() == std::vector<double>{0.5, 1.0, 2.0});
}

TEST_CASE("SingleTimeSeries holds structured payloads", "[core][single_time_series]") {
	const SingleTimeSeries series(
	    "cost", epoch2020(), Period::hours(1),
	    WindowData(std::vector<Polynomial>{Polynomial::linear(1.0, 2.0), Polynomial::linear(3.0, 4.0)}));

	REQUIRE(series.payloadKind() == fcaststore::core::PayloadKind::Polynomial);
	REQUIRE(series.shapeForStorage().shape() == DenseArray::Shape{2, 2});
	REQUIRE_THROWS_AS(series.toTimeArray(), NotImplementedError);
}

TEST_CASE("SingleTimeSeries subsets are derived series", "[core][single_time_series][subset]") {
	const SingleTimeSeries series("price", epoch2020(), Period::hours(1),
	                              WindowData(std::vector<double>{1.0, 2.0, 3.0, 4.0, 5.0}));
	const auto start = epoch2020() + std::chrono::hours{2};

	const auto subset = series.subset(start, 2);
	REQUIRE(subset.initialTimestamp() == start);
	REQUIRE(std::get<std::vector<double>>(subset.data()) == std::vector<double>{3.0, 4.0});
	REQUIRE(subset.payloadId() != series.payloadId());

	REQUIRE_THROWS_AS(series.subset(start + std::chrono::minutes{30}, 1), std::invalid_argument);
	REQUIRE_THROWS_AS(series.subset(start, 4), std::invalid_argument);
	REQUIRE_THROWS_AS(series.subset(epoch2020() - std::chrono::hours{1}, 1), std::invalid_argument);
	REQUIRE_THROWS_AS(series.subset(epoch2020() + std::chrono::hours{5}, 1), std::invalid_argument);
}

TEST_CASE("SingleTimeSeries subset rejects lengths past the end without wrapping",
          "[core][single_time_series][subset]") {
	const SingleTimeSeries series("price", epoch2020(), Period::hours(1),
	                              WindowData(std::vector<double>{1.0, 2.0, 3.0, 4.0}));
	const auto second = epoch2020() + std::chrono::hours{1};

	REQUIRE_THROWS_AS(series.subset(second, std::numeric_limits<std::size_t>::max()), std::invalid_argument);
	REQUIRE_THROWS_AS(series.subset(second, std::numeric_limits<std::size_t>::max() - 1), std::invalid_argument);
	REQUIRE(series.subset(second, 3).horizon() == 3);
}

TEST_CASE("SingleTimeSeries round trips through metadata", "[core][single_time_series][metadata]") {
	const SingleTimeSeries series("price", epoch2020(), Period::hours(1), WindowData(std::vector<double>{1.0, 2.0}));
	const auto meta = series.metadata();

	REQUIRE(meta.kind == SeriesKind::SingleTimeSeries);
	REQUIRE(meta.count == 1);
	REQUIRE(meta.horizon == 2);
	REQUIRE(meta.interval == Duration::zero());

	const auto restored = SingleTimeSeries::fromMetadata(meta, series.data());
	REQUIRE(restored.payloadId() == series.payloadId());
	REQUIRE(restored.initialTimestamp() == series.initialTimestamp());

	REQUIRE_THROWS_AS(SingleTimeSeries::fromMetadata(meta, WindowData(std::vector<double>{1.0, 2.0, 3.0})),
	                  std::invalid_argument);
}
