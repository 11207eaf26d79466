#pragma once

#include <tnid/crypto/aes.hpp>
#include <tnid/result.hpp>
#include <cstdint>
#include <vector>

namespace tnid::crypto {

// FF1 format-preserving encryption (NIST SP 800-38G) over AES-128.
//
// Numeral strings are vectors of digits in [0, radix), most significant
// first. Each half of the string must have radix^len <= 2^56, which covers
// 25 hex digits (TNID payloads) and the NIST AES-128 samples. Anything
// larger fails with InvalidArg.
class Ff1 {
public:
    Ff1(const Aes128::Key& key, uint32_t radix);

    Result<std::vector<uint32_t>> encrypt(const std::vector<uint8_t>& tweak,
                                          const std::vector<uint32_t>& plaintext) const;
    Result<std::vector<uint32_t>> decrypt(const std::vector<uint8_t>& tweak,
                                          const std::vector<uint32_t>& ciphertext) const;

    uint32_t radix() const { return radix_; }

private:
    Result<std::vector<uint32_t>> cipher(const std::vector<uint8_t>& tweak,
                                         const std::vector<uint32_t>& input,
                                         bool encrypting) const;
    Aes128::Block prf(const std::vector<uint8_t>& data) const;

    Aes128 aes_;
    uint32_t radix_;
};

} // namespace tnid::crypto
