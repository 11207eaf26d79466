#pragma once

#include <tnid/u128.hpp>
#include <cstddef>
#include <cstdint>

namespace tnid {

// Fills buf with OS randomness from /dev/urandom. When the device cannot be
// read, a process-wide mt19937_64 seeded from std::random_device is used
// instead (logged at debug level).
void fill_random_bytes(uint8_t* buf, size_t len);

// Big-endian assembly of 8 / 16 random bytes.
uint64_t random_u64();
U128 random_u128();

// Current Unix time in milliseconds.
uint64_t unix_millis_now();

} // namespace tnid
