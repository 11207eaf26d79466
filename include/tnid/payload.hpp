#pragma once

#include <tnid/name.hpp>
#include <tnid/result.hpp>
#include <tnid/u128.hpp>
#include <tnid/variant.hpp>
#include <cstdint>
#include <variant>

namespace tnid {

// Bit map of a TNID (bit 127 = most significant):
//
//   127..108  name (20)
//   107..80   payload A (28)
//    79..76   UUID version, 0b1000
//    75..64   payload B (12)
//    63..62   UUID variant, 0b10
//    61..60   TNID variant (2)
//    59..0    payload C (60)
//
// V0 payload: timestamp bits 42..15 -> A, 14..3 -> B, 2..0 -> C[59..57],
// random bits 56..0 -> C[56..0].
// V1 payload: all 100 bits of A, B and C are random.

struct V0Fields {
    uint64_t timestamp_ms = 0;  // < 2^43
    uint64_t random = 0;        // < 2^57
};

struct V1Fields {
    U128 random;  // payload bits in place, everything else zero
};

struct ReservedFields {
    U128 payload;  // compacted 100 payload bits (see extract_payload_bits)
};

struct Decoded {
    Variant variant = Variant::V0;
    std::variant<V0Fields, V1Fields, ReservedFields> fields;
};

namespace payload {

constexpr unsigned kTimestampBits = 43;
constexpr unsigned kV0RandomBits = 57;
constexpr unsigned kPayloadBits = 100;
constexpr unsigned kNameShift = 108;
constexpr unsigned kVariantShift = 60;

constexpr U128 kNameMask(0xFFFFF00000000000ULL, 0);
constexpr U128 kUuidMarkerMask(0x000000000000F000ULL, 0xC000000000000000ULL);
constexpr U128 kUuidMarker(0x0000000000008000ULL, 0x8000000000000000ULL);
constexpr U128 kVariantMask(0, 0x3000000000000000ULL);
constexpr U128 kPayloadMask(0x00000FFFFFFF0FFFULL, 0x0FFFFFFFFFFFFFFFULL);
constexpr U128 kV0RandomMask(0, 0x01FFFFFFFFFFFFFFULL);

// Inputs above 2^43 / 2^57 lose their high bits.
U128 encode_v0(uint64_t timestamp_ms, uint64_t random);

// Only the bits under kPayloadMask are kept.
U128 encode_v1(U128 random);

// Fails with UnknownVariant when the UUID version/variant bits are not
// those of a TNID. Name bits are ignored.
Result<Decoded> decode(U128 value);

bool has_uuid_marker(U128 value);
Variant variant_of(U128 value);
U128 set_variant(U128 value, Variant v);

uint32_t name_bits(U128 value);
U128 with_name(U128 value, const Name& name);

// Packs A|B|C into the low 100 bits, and back.
U128 extract_payload_bits(U128 value);
U128 expand_payload_bits(U128 compact);

} // namespace payload
} // namespace tnid
