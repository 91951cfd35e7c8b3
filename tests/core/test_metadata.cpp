#include <catch2/catch.hpp>

#include "fcast-store/core/metadata.hpp"

#include <set>
#include <stdexcept>

using fcaststore::core::PayloadId;
using fcaststore::core::SeriesKind;
using fcaststore::core::SeriesMetadata;

TEST_CASE("Generated payload ids are unique version 4 identifiers", "[core][metadata][payload_id]") {
	std::set<PayloadId> seen;
	for (int i = 0; i < 64; ++i) {
		const auto id = PayloadId::generate();
		REQUIRE_FALSE(id.isNil());
		REQUIRE(id.bytes()[6] >> 4 == 4);
		REQUIRE((id.bytes()[8] & 0xC0) == 0x80);
		REQUIRE(seen.insert(id).second);
	}
}

TEST_CASE("Payload ids round trip through text", "[core][metadata][payload_id]") {
	const auto id = PayloadId::generate();
	const auto text = id.toString();

	REQUIRE(text.size() == 36);
	REQUIRE(text[8] == '-');
	REQUIRE(text[14] == '4');
	REQUIRE(PayloadId::parse(text) == id);
	REQUIRE(PayloadId::parse("00000000-0000-0000-0000-000000000000").isNil());
	REQUIRE(PayloadId::parse("A1B2C3D4-0000-4000-8000-00000000000F").toString() ==
	        "a1b2c3d4-0000-4000-8000-00000000000f");
}

TEST_CASE("Malformed payload ids are rejected", "[core][metadata][payload_id]") {
	REQUIRE_THROWS_AS(PayloadId::parse("not-a-uuid"), std::invalid_argument);
	REQUIRE_THROWS_AS(PayloadId::parse("a1b2c3d4x0000-4000-8000-00000000000f"), std::invalid_argument);
	REQUIRE_THROWS_AS(PayloadId::parse("g1b2c3d4-0000-4000-8000-00000000000f"), std::invalid_argument);
}

TEST_CASE("Series metadata matches feature tags", "[core][metadata]") {
	SeriesMetadata meta;
	meta.features["scenario"] = "high";

	REQUIRE(meta.hasFeature("scenario", "high"));
	REQUIRE_FALSE(meta.hasFeature("scenario", "low"));
	REQUIRE_FALSE(meta.hasFeature("model_year", "2030"));
	REQUIRE(fcaststore::core::toString(SeriesKind::Probabilistic) == "Probabilistic");
}
