#include <tnid/crypto/ff1.hpp>

namespace tnid::crypto {

static constexpr int kRounds = 10;
static constexpr uint32_t kMaxRadix = 1u << 16;
static constexpr uint64_t kMaxHalfModulus = uint64_t(1) << 56;

// radix^exp, or false if it exceeds limit.
static bool checked_pow(uint64_t radix, size_t exp, uint64_t limit, uint64_t& out) {
    uint64_t r = 1;
    for (size_t i = 0; i < exp; ++i) {
        if (r > limit / radix) return false;
        r *= radix;
    }
    out = r;
    return true;
}

static unsigned bit_length(uint64_t x) {
    unsigned n = 0;
    while (x) {
        ++n;
        x >>= 1;
    }
    return n;
}

// NUM_radix(X[begin, end))
static uint64_t num(const std::vector<uint32_t>& x, size_t begin, size_t end, uint64_t radix) {
    uint64_t r = 0;
    for (size_t i = begin; i < end; ++i) {
        r = r * radix + x[i];
    }
    return r;
}

// STR^m_radix(x), appended to out
static void append_str(uint64_t x, size_t m, uint64_t radix, std::vector<uint32_t>& out) {
    size_t base = out.size();
    out.resize(base + m, 0);
    for (size_t i = m; i > 0; --i) {
        out[base + i - 1] = static_cast<uint32_t>(x % radix);
        x /= radix;
    }
}

Ff1::Ff1(const Aes128::Key& key, uint32_t radix)
    : aes_(key), radix_(radix) {}

Result<std::vector<uint32_t>> Ff1::encrypt(const std::vector<uint8_t>& tweak,
                                           const std::vector<uint32_t>& plaintext) const {
    return cipher(tweak, plaintext, true);
}

Result<std::vector<uint32_t>> Ff1::decrypt(const std::vector<uint8_t>& tweak,
                                           const std::vector<uint32_t>& ciphertext) const {
    return cipher(tweak, ciphertext, false);
}

// AES-CBC-MAC with a zero IV over whole blocks.
Aes128::Block Ff1::prf(const std::vector<uint8_t>& data) const {
    Aes128::Block state{};
    for (size_t off = 0; off < data.size(); off += Aes128::kBlockSize) {
        for (size_t j = 0; j < Aes128::kBlockSize; ++j) {
            state[j] ^= data[off + j];
        }
        state = aes_.encrypt_block(state);
    }
    return state;
}

Result<std::vector<uint32_t>> Ff1::cipher(const std::vector<uint8_t>& tweak,
                                          const std::vector<uint32_t>& input,
                                          bool encrypting) const {
    if (radix_ < 2 || radix_ > kMaxRadix) {
        return TnidError{TnidError::InvalidArg,
            "FF1 radix must be in [2, 65536], got " + std::to_string(radix_)};
    }
    const size_t n = input.size();
    if (n < 2) {
        return TnidError{TnidError::InvalidArg,
            "FF1 input must have at least 2 numerals"};
    }
    for (uint32_t digit : input) {
        if (digit >= radix_) {
            return TnidError{TnidError::InvalidArg,
                "FF1 numeral " + std::to_string(digit) + " out of range for radix " +
                std::to_string(radix_)};
        }
    }

    const size_t t = tweak.size();
    const size_t u = n / 2;
    const size_t v = n - u;

    uint64_t mod_v = 0;
    uint64_t mod_u = 0;
    if (!checked_pow(radix_, v, kMaxHalfModulus, mod_v)) {
        return TnidError{TnidError::InvalidArg,
            "FF1 input of " + std::to_string(n) + " numerals is too long for radix " +
            std::to_string(radix_),
            "each half must satisfy radix^len <= 2^56"};
    }
    // v - u is 0 or 1
    mod_u = (u == v) ? mod_v : mod_v / radix_;

    // b = ceil(ceil(v * log2(radix)) / 8), d = 4 * ceil(b / 4) + 4.
    // mod_v <= 2^56 keeps b <= 7 and d <= 12, so S is a prefix of R.
    const size_t b = (bit_length(mod_v - 1) + 7) / 8;
    const size_t d = 4 * ((b + 3) / 4) + 4;

    // P = [1]^1 || [2]^1 || [1]^1 || [radix]^3 || [10]^1 || [u mod 256]^1 || [n]^4 || [t]^4
    std::vector<uint8_t> pq = {
        1, 2, 1,
        static_cast<uint8_t>(radix_ >> 16),
        static_cast<uint8_t>(radix_ >> 8),
        static_cast<uint8_t>(radix_),
        static_cast<uint8_t>(kRounds),
        static_cast<uint8_t>(u),
        static_cast<uint8_t>(n >> 24),
        static_cast<uint8_t>(n >> 16),
        static_cast<uint8_t>(n >> 8),
        static_cast<uint8_t>(n),
        static_cast<uint8_t>(t >> 24),
        static_cast<uint8_t>(t >> 16),
        static_cast<uint8_t>(t >> 8),
        static_cast<uint8_t>(t)
    };
    const size_t pad = (16 - (t + b + 1) % 16) % 16;
    const size_t q_offset = pq.size();

    uint64_t a = num(input, 0, u, radix_);
    uint64_t bnum = num(input, u, n, radix_);

    for (int step = 0; step < kRounds; ++step) {
        const int i = encrypting ? step : kRounds - 1 - step;
        const uint64_t mod = (i % 2 == 0) ? mod_u : mod_v;

        // Q = T || [0]^pad || [i]^1 || [NUM_radix(B)]^b
        pq.resize(q_offset);
        pq.insert(pq.end(), tweak.begin(), tweak.end());
        pq.insert(pq.end(), pad, 0);
        pq.push_back(static_cast<uint8_t>(i));
        uint64_t src = encrypting ? bnum : a;
        for (size_t k = b; k > 0; --k) {
            pq.push_back(static_cast<uint8_t>(src >> (8 * (k - 1))));
        }

        Aes128::Block r = prf(pq);

        // y = NUM(S) mod radix^m
        uint64_t y = 0;
        for (size_t k = 0; k < d; ++k) {
            y = (y * 256 + r[k]) % mod;
        }

        if (encrypting) {
            uint64_t c = (a + y) % mod;
            a = bnum;
            bnum = c;
        } else {
            uint64_t c = (bnum + mod - y) % mod;
            bnum = a;
            a = c;
        }
    }

    std::vector<uint32_t> out;
    out.reserve(n);
    append_str(a, u, radix_, out);
    append_str(bnum, v, radix_, out);
    return Result<std::vector<uint32_t>>::ok(std::move(out));
}

} // namespace tnid::crypto
