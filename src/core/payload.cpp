#include <tnid/payload.hpp>

namespace tnid::payload {

static constexpr unsigned kSectionAShift = 80;
static constexpr unsigned kSectionAWidth = 28;
static constexpr unsigned kSectionBShift = 64;
static constexpr unsigned kSectionBWidth = 12;
static constexpr unsigned kSectionCWidth = 60;

U128 encode_v0(uint64_t timestamp_ms, uint64_t random) {
    uint64_t ts = timestamp_ms & ((uint64_t(1) << kTimestampBits) - 1);

    U128 value = kUuidMarker;
    value = value | (U128::from_u64(ts >> 15) << kSectionAShift);
    value = value | (U128::from_u64((ts >> 3) & 0xFFF) << kSectionBShift);
    value = value | (U128::from_u64(ts & 0x7) << kV0RandomBits);
    value = value | (U128::from_u64(random) & kV0RandomMask);
    return set_variant(value, Variant::V0);
}

U128 encode_v1(U128 random) {
    return set_variant(kUuidMarker | (random & kPayloadMask), Variant::V1);
}

Result<Decoded> decode(U128 value) {
    if (!has_uuid_marker(value)) {
        return TnidError{TnidError::UnknownVariant,
            "value is not a TNID: UUID version/variant bits are not v8/0b10"};
    }

    Decoded out;
    out.variant = variant_of(value);
    switch (out.variant) {
        case Variant::V0: {
            V0Fields f;
            f.timestamp_ms = (value.field(kSectionAShift, kSectionAWidth) << 15)
                           | (value.field(kSectionBShift, kSectionBWidth) << 3)
                           | value.field(kV0RandomBits, 3);
            f.random = value.field(0, kV0RandomBits);
            out.fields = f;
            break;
        }
        case Variant::V1:
            out.fields = V1Fields{value & kPayloadMask};
            break;
        case Variant::V2:
        case Variant::V3:
            out.fields = ReservedFields{extract_payload_bits(value)};
            break;
    }
    return Result<Decoded>::ok(out);
}

bool has_uuid_marker(U128 value) {
    return (value & kUuidMarkerMask) == kUuidMarker;
}

Variant variant_of(U128 value) {
    return variant_from_tag(static_cast<uint8_t>(value.field(kVariantShift, 2)));
}

U128 set_variant(U128 value, Variant v) {
    return (value & ~kVariantMask)
         | (U128::from_u64(variant_tag(v)) << kVariantShift);
}

uint32_t name_bits(U128 value) {
    return static_cast<uint32_t>(value.field(kNameShift, Name::kBitWidth));
}

U128 with_name(U128 value, const Name& name) {
    return (value & ~kNameMask) | (U128::from_u64(name.bits()) << kNameShift);
}

U128 extract_payload_bits(U128 value) {
    U128 compact = value & U128::low_bits(kSectionCWidth);
    compact = compact | (U128::from_u64(value.field(kSectionBShift, kSectionBWidth))
                         << kSectionCWidth);
    compact = compact | (U128::from_u64(value.field(kSectionAShift, kSectionAWidth))
                         << (kSectionCWidth + kSectionBWidth));
    return compact;
}

U128 expand_payload_bits(U128 compact) {
    U128 value = compact & U128::low_bits(kSectionCWidth);
    value = value | (U128::from_u64(compact.field(kSectionCWidth, kSectionBWidth))
                     << kSectionBShift);
    value = value | (U128::from_u64(compact.field(kSectionCWidth + kSectionBWidth,
                                                  kSectionAWidth))
                     << kSectionAShift);
    return value;
}

} // namespace tnid::payload
