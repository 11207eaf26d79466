#include <tnid/text.hpp>
#include <tnid/payload.hpp>

namespace tnid::text {

static const char data_chars[] =
    "-0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZ_abcdefghijklmnopqrstuvwxyz";

static int data_val(char c) {
    if (c == '-') return 0;
    if (c >= '0' && c <= '9') return c - '0' + 1;
    if (c >= 'A' && c <= 'Z') return c - 'A' + 11;
    if (c == '_') return 37;
    if (c >= 'a' && c <= 'z') return c - 'a' + 38;
    return -1;
}

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

bool is_data_char(char c) {
    return data_val(c) >= 0;
}

// ---- Data string ----
// Bit offsets inside the 102-bit data value.

static constexpr unsigned kDataAShift = 74;
static constexpr unsigned kDataBShift = 62;
static constexpr unsigned kDataVariantShift = 60;

std::string encode_data(U128 value) {
    U128 data = U128::from_u64(value.field(80, 28)) << kDataAShift;
    data = data | (U128::from_u64(value.field(64, 12)) << kDataBShift);
    data = data | (U128::from_u64(value.field(60, 2)) << kDataVariantShift);
    data = data | (value & U128::low_bits(60));

    std::string out(kDataLength, '-');
    for (size_t i = 0; i < kDataLength; ++i) {
        unsigned shift = static_cast<unsigned>((kDataLength - 1 - i) * 6);
        out[i] = data_chars[data.field(shift, 6)];
    }
    return out;
}

Result<U128> decode_data(const std::string& data, const Name& name) {
    if (data.size() != kDataLength) {
        return TnidError{TnidError::MalformedString,
            "TNID data must be 17 characters",
            "Got " + std::to_string(data.size()) + " characters"};
    }

    U128 bits;
    for (size_t i = 0; i < kDataLength; ++i) {
        int v = data_val(data[i]);
        if (v < 0) {
            return TnidError{TnidError::MalformedString,
                "TNID data contains invalid character",
                std::string("Invalid char '") + data[i] + "' at position " +
                std::to_string(i)};
        }
        bits = (bits << 6) | U128::from_u64(static_cast<uint64_t>(v));
    }

    U128 value = payload::kUuidMarker;
    value = value | (U128::from_u64(bits.field(kDataAShift, 28)) << 80);
    value = value | (U128::from_u64(bits.field(kDataBShift, 12)) << 64);
    value = value | (U128::from_u64(bits.field(kDataVariantShift, 2)) << 60);
    value = value | (bits & U128::low_bits(60));
    return Result<U128>::ok(payload::with_name(value, name));
}

// ---- UUID hex ----

std::string format_uuid(U128 value, Case c) {
    const char* hex_chars = c == Case::Upper ? "0123456789ABCDEF"
                                             : "0123456789abcdef";
    auto bytes = value.to_bytes();
    std::string out;
    out.reserve(kUuidLength);
    for (int i = 0; i < 16; ++i) {
        out += hex_chars[bytes[i] >> 4];
        out += hex_chars[bytes[i] & 0x0F];
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            out += '-';
        }
    }
    return out;
}

Result<U128> parse_uuid(const std::string& s) {
    if (s.size() != kUuidLength) {
        return TnidError{TnidError::MalformedUuid,
            "UUID string must be 36 characters",
            "Expected format: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx"};
    }
    if (s[8] != '-' || s[13] != '-' || s[18] != '-' || s[23] != '-') {
        return TnidError{TnidError::MalformedUuid,
            "UUID string has invalid dash positions",
            "Expected dashes at positions 8, 13, 18, 23"};
    }

    std::array<uint8_t, 16> bytes{};
    int byte_idx = 0;
    for (size_t i = 0; i < kUuidLength; ) {
        if (i == 8 || i == 13 || i == 18 || i == 23) { ++i; continue; }
        int hi = hex_val(s[i]);
        int lo = hex_val(s[i + 1]);
        if (hi < 0 || lo < 0) {
            return TnidError{TnidError::MalformedUuid,
                "UUID string contains invalid hex character",
                std::string("Invalid char at position ") + std::to_string(hi < 0 ? i : i + 1)};
        }
        bytes[byte_idx++] = static_cast<uint8_t>((hi << 4) | lo);
        i += 2;
    }
    return Result<U128>::ok(U128::from_bytes(bytes));
}

} // namespace tnid::text
