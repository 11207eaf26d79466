#include <catch2/catch.hpp>
#include <tnid/variant.hpp>

using namespace tnid;

TEST_CASE("variant tags are 0..3", "[variant]") {
    REQUIRE(variant_tag(Variant::V0) == 0);
    REQUIRE(variant_tag(Variant::V1) == 1);
    REQUIRE(variant_tag(Variant::V2) == 2);
    REQUIRE(variant_tag(Variant::V3) == 3);
    REQUIRE(variant_from_tag(2) == Variant::V2);
    REQUIRE(variant_from_tag(7) == Variant::V3);
}

TEST_CASE("variant names round trip", "[variant]") {
    for (auto v : {Variant::V0, Variant::V1, Variant::V2, Variant::V3}) {
        auto r = parse_variant(variant_name(v));
        REQUIRE(r.is_ok());
        REQUIRE(r.value() == v);
    }
    REQUIRE(parse_variant("V1").value() == Variant::V1);
}

TEST_CASE("unknown variant names are rejected", "[variant]") {
    for (const char* s : {"", "v4", "0", "time"}) {
        auto r = parse_variant(s);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == TnidError::UnknownVariant);
    }
}
