#include <catch2/catch.hpp>

#include "common/forecast_helpers.hpp"
#include "fcast-store/core/deterministic.hpp"
#include "fcast-store/core/row_forecast.hpp"
#include "fcast-store/io/array_writer.hpp"

#include <stdexcept>
#include <vector>

using fcaststore::core::DenseArray;
using fcaststore::core::Deterministic;
using fcaststore::core::PayloadId;
using fcaststore::core::Period;
using fcaststore::io::InMemoryArrayStore;

TEST_CASE("InMemoryArrayStore keeps arrays by payload id", "[io][array_writer]") {
	InMemoryArrayStore store;
	const auto id = PayloadId::generate();
	const DenseArray array({2}, {1.0, 2.0});

	store.write(id, array);
	REQUIRE(store.size() == 1);
	REQUIRE(store.contains(id));
	REQUIRE(store.read(id) == array);

	REQUIRE_THROWS_AS(store.write(id, array), std::invalid_argument);
	REQUIRE_THROWS_AS(store.write(PayloadId(), array), std::invalid_argument);

	REQUIRE(store.remove(id));
	REQUIRE_FALSE(store.remove(id));
	REQUIRE_FALSE(store.contains(id));
	REQUIRE_THROWS_AS(store.read(id), std::out_of_range);
}

TEST_CASE("storeSeries writes the shaped payload and returns metadata", "[io][array_writer]") {
	InMemoryArrayStore store;
	const auto forecast =
	    Deterministic::fromValues("load", tests::helpers::makeConstantWindows(3, 4), Period::hours(1));

	const auto meta = fcaststore::io::storeSeries(store, forecast);
	REQUIRE(meta.payload_id == forecast.payloadId());
	REQUIRE(meta.count == 3);
	REQUIRE(store.read(forecast.payloadId()).shape() == DenseArray::Shape{4, 3});

	const Deterministic derived(forecast, forecast.data());
	fcaststore::io::storeSeries(store, derived);
	REQUIRE(store.size() == 2);

	REQUIRE_THROWS_AS(fcaststore::io::storeSeries(store, forecast), std::invalid_argument);
}

TEST_CASE("storeSeries handles row forecasts", "[io][array_writer]") {
	fcaststore::core::RawRowSeries rows;
	rows.emplace(tests::helpers::epoch2020(), std::vector<fcaststore::core::Row>{{1.0, 2.0}, {3.0, 4.0}});
	const auto forecast = fcaststore::core::Probabilistic::fromRaw("load", rows, {10.0, 90.0}, Period::hours(1));

	InMemoryArrayStore store;
	const auto meta = fcaststore::io::storeSeries(store, forecast);
	REQUIRE(meta.percentiles == std::vector<double>{10.0, 90.0});
	REQUIRE(store.read(meta.payload_id).shape() == DenseArray::Shape{2, 1, 2});
}
