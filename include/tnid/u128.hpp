#pragma once

#include <array>
#include <cstdint>

namespace tnid {

// Unsigned 128-bit integer stored as two 64-bit halves. Supports the
// bitwise logic, shifts and big-endian conversion the codec needs.
struct U128 {
    uint64_t hi = 0;
    uint64_t lo = 0;

    constexpr U128() = default;
    constexpr U128(uint64_t high, uint64_t low) : hi(high), lo(low) {}

    static constexpr U128 from_u64(uint64_t v) { return U128(0, v); }

    // Value with the low n bits set (n in [0, 128]).
    static constexpr U128 low_bits(unsigned n) {
        if (n == 0) return U128();
        if (n < 64) return U128(0, (uint64_t(1) << n) - 1);
        if (n == 64) return U128(0, ~uint64_t(0));
        if (n < 128) return U128((uint64_t(1) << (n - 64)) - 1, ~uint64_t(0));
        return U128(~uint64_t(0), ~uint64_t(0));
    }

    static U128 from_bytes(const std::array<uint8_t, 16>& bytes) {
        U128 v;
        for (int i = 0; i < 8; ++i) {
            v.hi = (v.hi << 8) | bytes[i];
            v.lo = (v.lo << 8) | bytes[i + 8];
        }
        return v;
    }

    std::array<uint8_t, 16> to_bytes() const {
        std::array<uint8_t, 16> out{};
        for (int i = 0; i < 8; ++i) {
            out[7 - i] = static_cast<uint8_t>(hi >> (8 * i));
            out[15 - i] = static_cast<uint8_t>(lo >> (8 * i));
        }
        return out;
    }

    // Bits [shift, shift + width) as a u64 (width <= 64).
    constexpr uint64_t field(unsigned shift, unsigned width) const;

    constexpr bool is_zero() const { return hi == 0 && lo == 0; }
};

constexpr U128 operator&(U128 a, U128 b) { return U128(a.hi & b.hi, a.lo & b.lo); }
constexpr U128 operator|(U128 a, U128 b) { return U128(a.hi | b.hi, a.lo | b.lo); }
constexpr U128 operator^(U128 a, U128 b) { return U128(a.hi ^ b.hi, a.lo ^ b.lo); }
constexpr U128 operator~(U128 a) { return U128(~a.hi, ~a.lo); }

constexpr U128 operator<<(U128 a, unsigned n) {
    if (n == 0) return a;
    if (n >= 128) return U128();
    if (n >= 64) return U128(a.lo << (n - 64), 0);
    return U128((a.hi << n) | (a.lo >> (64 - n)), a.lo << n);
}

constexpr U128 operator>>(U128 a, unsigned n) {
    if (n == 0) return a;
    if (n >= 128) return U128();
    if (n >= 64) return U128(0, a.hi >> (n - 64));
    return U128(a.hi >> n, (a.lo >> n) | (a.hi << (64 - n)));
}

constexpr bool operator==(U128 a, U128 b) { return a.hi == b.hi && a.lo == b.lo; }
constexpr bool operator!=(U128 a, U128 b) { return !(a == b); }
constexpr bool operator<(U128 a, U128 b) {
    return a.hi < b.hi || (a.hi == b.hi && a.lo < b.lo);
}

constexpr uint64_t U128::field(unsigned shift, unsigned width) const {
    return ((*this >> shift) & low_bits(width)).lo;
}

} // namespace tnid
