#include <tnid/name.hpp>

namespace tnid {

static const char name_chars[] = "01234abcdefghijklmnopqrstuvwxyz";

// 5-bit value for a name character, 0 if not allowed.
static uint32_t char_value(char c) {
    if (c >= '0' && c <= '4') return static_cast<uint32_t>(c - '0') + 1;
    if (c >= 'a' && c <= 'z') return static_cast<uint32_t>(c - 'a') + 6;
    return 0;
}

Result<Name> Name::parse(const std::string& raw) {
    if (raw.empty() || raw.size() > kMaxLength) {
        return TnidError{TnidError::InvalidLength,
            "invalid name length " + std::to_string(raw.size()) +
            " for '" + raw + "'",
            "names are 1 to 4 characters"};
    }

    uint32_t bits = 0;
    for (size_t i = 0; i < kMaxLength; ++i) {
        bits <<= 5;
        if (i >= raw.size()) continue;
        uint32_t v = char_value(raw[i]);
        if (v == 0) {
            return TnidError{TnidError::InvalidCharacter,
                "invalid character '" + std::string(1, raw[i]) +
                "' in name '" + raw + "'",
                "allowed: [0-4a-z]"};
        }
        bits |= v;
    }

    Name name;
    name.value_ = raw;
    name.bits_ = bits;
    return Result<Name>::ok(std::move(name));
}

Result<Name> Name::from_bits(uint32_t bits) {
    if (bits >> kBitWidth) {
        return TnidError{TnidError::InvalidArg,
            "name bits exceed 20 bits"};
    }

    std::string raw;
    bool terminated = false;
    for (int i = 3; i >= 0; --i) {
        uint32_t v = (bits >> (i * 5)) & 0x1F;
        if (v == 0) {
            terminated = true;
            continue;
        }
        if (terminated) {
            return TnidError{TnidError::InvalidCharacter,
                "invalid name encoding: character after null terminator"};
        }
        raw += name_chars[v - 1];
    }

    if (raw.empty()) {
        return TnidError{TnidError::InvalidLength,
            "invalid name encoding: all name bits are zero"};
    }

    Name name;
    name.value_ = std::move(raw);
    name.bits_ = bits;
    return Result<Name>::ok(std::move(name));
}

const std::string& Name::str() const { return value_; }
uint32_t Name::bits() const { return bits_; }

std::string Name::hex() const {
    static const char hex_chars[] = "0123456789abcdef";
    std::string out(5, '0');
    for (int i = 0; i < 5; ++i) {
        out[4 - i] = hex_chars[(bits_ >> (i * 4)) & 0xF];
    }
    return out;
}

bool Name::operator==(const Name& o) const {
    return bits_ == o.bits_;
}

bool Name::operator!=(const Name& o) const {
    return !(*this == o);
}

bool Name::operator<(const Name& o) const {
    return bits_ < o.bits_;
}

bool is_valid_name(const std::string& candidate) {
    return Name::parse(candidate).is_ok();
}

} // namespace tnid
