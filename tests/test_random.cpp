#include <catch2/catch.hpp>
#include <tnid/random.hpp>
#include <set>

using namespace tnid;

TEST_CASE("fill_random_bytes fills the whole buffer", "[random]") {
    // 33 bytes so the length is not a multiple of 8
    std::array<uint8_t, 33> a{};
    std::array<uint8_t, 33> b{};
    fill_random_bytes(a.data(), a.size());
    fill_random_bytes(b.data(), b.size());
    REQUIRE(a != b);
}

TEST_CASE("random values do not repeat", "[random]") {
    std::set<uint64_t> seen;
    for (int i = 0; i < 100; ++i) seen.insert(random_u64());
    REQUIRE(seen.size() == 100);
    REQUIRE(random_u128() != random_u128());
}

TEST_CASE("clock reads Unix milliseconds", "[random]") {
    // 2020-01-01T00:00:00Z
    REQUIRE(unix_millis_now() > 1577836800000ULL);
    REQUIRE(unix_millis_now() < (uint64_t(1) << 43));
}
