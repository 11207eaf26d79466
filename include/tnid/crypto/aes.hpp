#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace tnid::crypto {

// AES-128 forward cipher (FIPS-197). FF1 only ever encrypts, so there is
// no inverse cipher. Round keys are wiped on destruction.
class Aes128 {
public:
    static constexpr size_t kBlockSize = 16;
    static constexpr size_t kKeySize = 16;
    using Block = std::array<uint8_t, kBlockSize>;
    using Key = std::array<uint8_t, kKeySize>;

    explicit Aes128(const Key& key);
    ~Aes128();

    Aes128(const Aes128&) = delete;
    Aes128& operator=(const Aes128&) = delete;

    Block encrypt_block(const Block& in) const;

private:
    void expand_key(const Key& key);

    std::array<uint8_t, 176> round_keys_;  // 11 round keys of 16 bytes
};

} // namespace tnid::crypto
