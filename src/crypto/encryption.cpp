#include <tnid/encryption.hpp>
#include <tnid/crypto/ff1.hpp>
#include <tnid/payload.hpp>

namespace tnid {

static constexpr uint32_t kRadix = 16;
static constexpr size_t kHexDigits = payload::kPayloadBits / 4;

static int hex_val(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// ---- EncryptionKey ----

Result<EncryptionKey> EncryptionKey::from_bytes(const uint8_t* data, size_t len) {
    if (len != kSize) {
        return TnidError{TnidError::InvalidKeyLength,
            "encryption key must be 16 bytes, got " + std::to_string(len)};
    }
    EncryptionKey key;
    for (size_t i = 0; i < kSize; ++i) {
        key.bytes_[i] = data[i];
    }
    return Result<EncryptionKey>::ok(key);
}

Result<EncryptionKey> EncryptionKey::from_bytes(const std::vector<uint8_t>& data) {
    return from_bytes(data.data(), data.size());
}

Result<EncryptionKey> EncryptionKey::from_hex(const std::string& hex) {
    if (hex.size() != kSize * 2) {
        return TnidError{TnidError::InvalidKeyLength,
            "encryption key hex string must be 32 characters, got " +
            std::to_string(hex.size())};
    }

    EncryptionKey key;
    for (size_t i = 0; i < kSize; ++i) {
        int hi = hex_val(hex[2 * i]);
        int lo = hex_val(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return TnidError{TnidError::InvalidCharacter,
                "encryption key hex string contains invalid characters",
                std::string("Invalid char at position ") +
                std::to_string(hi < 0 ? 2 * i : 2 * i + 1)};
        }
        key.bytes_[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return Result<EncryptionKey>::ok(key);
}

std::string EncryptionKey::to_hex() const {
    static const char hex_chars[] = "0123456789abcdef";
    std::string out;
    out.reserve(kSize * 2);
    for (uint8_t b : bytes_) {
        out += hex_chars[b >> 4];
        out += hex_chars[b & 0x0F];
    }
    return out;
}

// ---- Transform ----

// Runs FF1 over the compacted payload bits of value and writes the result
// back into sections A/B/C. Name, UUID and variant bits are untouched.
static Result<U128> transform_payload(U128 value, const EncryptionKey& key, bool encrypting) {
    U128 compact = payload::extract_payload_bits(value);

    std::vector<uint32_t> digits(kHexDigits);
    for (size_t i = 0; i < kHexDigits; ++i) {
        digits[i] = static_cast<uint32_t>(
            compact.field(static_cast<unsigned>((kHexDigits - 1 - i) * 4), 4));
    }

    crypto::Ff1 ff1(key.bytes(), kRadix);
    const std::vector<uint8_t> tweak;
    TNID_TRY_ASSIGN(auto out, encrypting ? ff1.encrypt(tweak, digits)
                                         : ff1.decrypt(tweak, digits));

    U128 result;
    for (uint32_t d : out) {
        result = (result << 4) | U128::from_u64(d);
    }
    return Result<U128>::ok((value & ~payload::kPayloadMask) |
                            payload::expand_payload_bits(result));
}

Result<Tnid> encrypt_v0_to_v1(const Tnid& id, const EncryptionKey& key) {
    if (id.variant() != Variant::V0) {
        return TnidError{TnidError::WrongVariant,
            std::string("only v0 TNIDs can be encrypted, got ") + variant_name(id.variant())};
    }
    TNID_TRY_ASSIGN(U128 value, transform_payload(id.as_u128(), key, true));
    return Tnid::from_u128(payload::set_variant(value, Variant::V1));
}

Result<Tnid> decrypt_v1_to_v0(const Tnid& id, const EncryptionKey& key) {
    if (id.variant() != Variant::V1) {
        return TnidError{TnidError::WrongVariant,
            std::string("only v1 TNIDs can be decrypted, got ") + variant_name(id.variant())};
    }
    TNID_TRY_ASSIGN(U128 value, transform_payload(id.as_u128(), key, false));
    return Tnid::from_u128(payload::set_variant(value, Variant::V0));
}

} // namespace tnid
