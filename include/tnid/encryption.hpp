#pragma once

#include <tnid/crypto/aes.hpp>
#include <tnid/result.hpp>
#include <tnid/tnid.hpp>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace tnid {

// 128-bit key for the V0 <-> V1 transform.
class EncryptionKey {
public:
    static constexpr size_t kSize = crypto::Aes128::kKeySize;

    static Result<EncryptionKey> from_bytes(const uint8_t* data, size_t len);
    static Result<EncryptionKey> from_bytes(const std::vector<uint8_t>& data);
    // 32 hex characters, either case.
    static Result<EncryptionKey> from_hex(const std::string& hex);

    const crypto::Aes128::Key& bytes() const { return bytes_; }
    std::string to_hex() const;

    bool operator==(const EncryptionKey& o) const { return bytes_ == o.bytes_; }
    bool operator!=(const EncryptionKey& o) const { return bytes_ != o.bytes_; }

private:
    crypto::Aes128::Key bytes_{};
};

// Encrypts the 100 payload bits of a V0 TNID with FF1 (radix 16, 25 digits,
// empty tweak) and retags the result V1. Name and UUID bits are kept.
// Fails with WrongVariant unless the input is V0.
Result<Tnid> encrypt_v0_to_v1(const Tnid& id, const EncryptionKey& key);

// Inverse of encrypt_v0_to_v1. There is no integrity check: a wrong key
// yields a well-formed V0 TNID with meaningless fields.
// Fails with WrongVariant unless the input is V1.
Result<Tnid> decrypt_v1_to_v0(const Tnid& id, const EncryptionKey& key);

} // namespace tnid
