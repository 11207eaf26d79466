#include <catch2/catch.hpp>
#include <tnid/payload.hpp>

using namespace tnid;
using namespace tnid::payload;

static V0Fields v0_of(U128 value) {
    auto d = decode(value);
    REQUIRE(d.is_ok());
    REQUIRE(d.value().variant == Variant::V0);
    return std::get<V0Fields>(d.value().fields);
}

TEST_CASE("v0 with zero inputs is just the UUID marker", "[payload]") {
    REQUIRE(encode_v0(0, 0) == kUuidMarker);
    REQUIRE(has_uuid_marker(encode_v0(0, 0)));
}

TEST_CASE("v0 timestamp bit positions", "[payload]") {
    // ts bit 0 -> value bit 57
    REQUIRE(encode_v0(1, 0) == U128(0x8000, 0x8200000000000000ULL));
    // ts bit 3 -> value bit 64 (section B)
    REQUIRE(encode_v0(8, 0) == U128(0x8001, 0x8000000000000000ULL));
    // ts bit 15 -> value bit 80 (section A)
    REQUIRE(encode_v0(uint64_t(1) << 15, 0) == U128(0x18000, 0x8000000000000000ULL));
    // ts bit 42 -> value bit 107
    REQUIRE(encode_v0(uint64_t(1) << 42, 0) ==
            U128(0x0000080000008000ULL, 0x8000000000000000ULL));
}

TEST_CASE("v0 random bit positions", "[payload]") {
    REQUIRE(encode_v0(0, 1) == U128(0x8000, 0x8000000000000001ULL));
    REQUIRE(encode_v0(0, (uint64_t(1) << 57) - 1) ==
            U128(0x8000, 0x81FFFFFFFFFFFFFFULL));
}

TEST_CASE("v0 inputs are truncated to 43 and 57 bits", "[payload]") {
    REQUIRE(encode_v0(uint64_t(1) << 43, 0) == encode_v0(0, 0));
    REQUIRE(encode_v0(0, uint64_t(1) << 57) == encode_v0(0, 0));
    REQUIRE(encode_v0(~uint64_t(0), ~uint64_t(0)) ==
            encode_v0((uint64_t(1) << 43) - 1, (uint64_t(1) << 57) - 1));
}

TEST_CASE("v0 decode recovers representable inputs exactly", "[payload]") {
    const uint64_t max_ts = (uint64_t(1) << 43) - 1;
    const uint64_t max_rand = (uint64_t(1) << 57) - 1;
    const uint64_t cases[][2] = {
        {0, 0},
        {1, 1},
        {1700000000000ULL, 0x0123456789abcdefULL},
        {max_ts, max_rand},
        {max_ts, 0},
        {0, max_rand},
        {0x5555555555ULL, 0x0AAAAAAAAAAAAAAULL},
    };
    for (const auto& c : cases) {
        auto f = v0_of(encode_v0(c[0], c[1]));
        REQUIRE(f.timestamp_ms == c[0]);
        REQUIRE(f.random == c[1]);
    }
}

TEST_CASE("v1 keeps only payload bits and sets the tag", "[payload]") {
    U128 all = ~U128();
    U128 v = encode_v1(all);
    REQUIRE(v == U128(0x00000FFFFFFF8FFFULL, 0x9FFFFFFFFFFFFFFFULL));
    REQUIRE(variant_of(v) == Variant::V1);

    auto d = decode(v);
    REQUIRE(d.is_ok());
    REQUIRE(d.value().variant == Variant::V1);
    REQUIRE(std::get<V1Fields>(d.value().fields).random == kPayloadMask);

    REQUIRE(encode_v1(U128()) == set_variant(kUuidMarker, Variant::V1));
}

TEST_CASE("reserved variants decode to raw payload bits", "[payload]") {
    U128 v2 = set_variant(kUuidMarker | U128(0, 0x123), Variant::V2);
    auto d = decode(v2);
    REQUIRE(d.is_ok());
    REQUIRE(d.value().variant == Variant::V2);
    REQUIRE(std::get<ReservedFields>(d.value().fields).payload == U128(0, 0x123));

    auto d3 = decode(set_variant(v2, Variant::V3));
    REQUIRE(d3.value().variant == Variant::V3);
}

TEST_CASE("decode rejects values without the UUID v8 marker", "[payload]") {
    auto zero = decode(U128());
    REQUIRE(zero.is_err());
    REQUIRE(zero.error().code == TnidError::UnknownVariant);

    // UUID version 4 instead of 8
    U128 v4 = (encode_v0(1, 1) & ~kUuidMarkerMask) | U128(0x4000, 0x8000000000000000ULL);
    REQUIRE(decode(v4).error().code == TnidError::UnknownVariant);

    // RFC variant bits 0b11
    U128 bad_variant = encode_v0(1, 1) | U128(0, 0x4000000000000000ULL);
    REQUIRE(decode(bad_variant).error().code == TnidError::UnknownVariant);
}

TEST_CASE("set_variant and with_name touch only their bits", "[payload]") {
    U128 v = encode_v0(1700000000000ULL, 42);
    U128 v3 = set_variant(v, Variant::V3);
    REQUIRE(variant_of(v3) == Variant::V3);
    REQUIRE((v3 & ~kVariantMask) == (v & ~kVariantMask));

    auto name = Name::parse("user").value();
    U128 named = with_name(v, name);
    REQUIRE(name_bits(named) == name.bits());
    REQUIRE((named & ~kNameMask) == v);
}

TEST_CASE("payload bits compact and expand", "[payload]") {
    REQUIRE(expand_payload_bits(U128::low_bits(kPayloadBits)) == kPayloadMask);
    REQUIRE(extract_payload_bits(~U128()) == U128::low_bits(kPayloadBits));

    // lowest bit of section A -> compact bit 72
    REQUIRE(extract_payload_bits(U128(uint64_t(1) << 16, 0)) == U128(uint64_t(1) << 8, 0));
    // lowest bit of section B -> compact bit 60
    REQUIRE(extract_payload_bits(U128(1, 0)) == U128(0, uint64_t(1) << 60));

    U128 v = encode_v0(1700000000000ULL, 0x0123456789abcdefULL);
    REQUIRE(extract_payload_bits(v) == U128(0x3179fcad0ULL, 0x0123456789abcdefULL));
    REQUIRE(expand_payload_bits(extract_payload_bits(v)) == (v & kPayloadMask));
}
