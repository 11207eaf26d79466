#pragma once

#include <tnid/result.hpp>
#include <cstdint>
#include <string>

namespace tnid {

// TNID variant tag, stored in 2 bits of the 128-bit value.
enum class Variant : uint8_t {
    V0 = 0,  // time-ordered: 43-bit millisecond timestamp + 57 random bits
    V1 = 1,  // high-entropy: 100 random bits
    V2 = 2,  // reserved
    V3 = 3   // reserved
};

inline uint8_t variant_tag(Variant v) {
    return static_cast<uint8_t>(v);
}

inline Variant variant_from_tag(uint8_t tag) {
    return static_cast<Variant>(tag & 0x3);
}

// "v0".."v3"
const char* variant_name(Variant v);
Result<Variant> parse_variant(const std::string& name);

} // namespace tnid
