#include <catch2/catch.hpp>
#include <tnid/payload.hpp>
#include <tnid/text.hpp>

using namespace tnid;

TEST_CASE("data alphabet membership", "[text]") {
    for (char c : std::string("-0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ_abcdefghijklmnopqrstuvwxyz")) {
        REQUIRE(text::is_data_char(c));
    }
    for (char c : std::string(".+/= \t!")) {
        REQUIRE_FALSE(text::is_data_char(c));
    }
}

TEST_CASE("encode_data of known values", "[text]") {
    REQUIRE(text::encode_data(payload::kUuidMarker) == "-----------------");
    REQUIRE(text::encode_data(payload::encode_v0(1000, 5)) == "-----6o---------4");
    REQUIRE(text::encode_data(payload::encode_v1(~U128())) == "zzzzzzxzzzzzzzzzz");
}

TEST_CASE("decode_data rebuilds the value with the name", "[text]") {
    auto name = Name::parse("user").value();
    U128 v = payload::with_name(payload::encode_v0(1234567890, 0), name);
    auto data = text::encode_data(v);
    REQUIRE(data == "--Zmk4cF---------");

    auto back = text::decode_data(data, name);
    REQUIRE(back.is_ok());
    REQUIRE(back.value() == v);
}

TEST_CASE("decode_data rejects malformed data", "[text]") {
    auto name = Name::parse("a").value();

    auto shortr = text::decode_data("----------------", name);
    REQUIRE(shortr.is_err());
    REQUIRE(shortr.error().code == TnidError::MalformedString);

    auto longr = text::decode_data("------------------", name);
    REQUIRE(longr.error().code == TnidError::MalformedString);

    auto bad = text::decode_data("--------.--------", name);
    REQUIRE(bad.error().code == TnidError::MalformedString);
}

TEST_CASE("format_uuid in both cases", "[text]") {
    U128 v(0xd62e03179fca8d00ULL, 0x8123456789abcdefULL);
    REQUIRE(text::format_uuid(v, Case::Lower) == "d62e0317-9fca-8d00-8123-456789abcdef");
    REQUIRE(text::format_uuid(v, Case::Upper) == "D62E0317-9FCA-8D00-8123-456789ABCDEF");
}

TEST_CASE("parse_uuid accepts either case", "[text]") {
    U128 v(0xd62e03179fca8d00ULL, 0x8123456789abcdefULL);
    REQUIRE(text::parse_uuid("d62e0317-9fca-8d00-8123-456789abcdef").value() == v);
    REQUIRE(text::parse_uuid("D62E0317-9FCA-8D00-8123-456789ABCDEF").value() == v);
    REQUIRE(text::parse_uuid("D62e0317-9FCA-8d00-8123-456789abcDEF").value() == v);
}

TEST_CASE("parse_uuid rejects malformed strings", "[text]") {
    const char* bad[] = {
        "",
        "d62e0317-9fca-8d00-8123-456789abcde",
        "d62e0317-9fca-8d00-8123-456789abcdef0",
        "d62e03179fca-8d00-8123-456789abcdef0",
        "d62e0317-9fca-8d00-8123_456789abcdef",
        "d62e0317-9fca-8d00-8123-456789abcdeg",
        "{62e0317-9fca-8d00-8123-456789abcdef",
    };
    for (const char* s : bad) {
        auto r = text::parse_uuid(s);
        REQUIRE(r.is_err());
        REQUIRE(r.error().code == TnidError::MalformedUuid);
    }
}
