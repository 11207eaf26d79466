#include <tnid/random.hpp>
#include <tnid/log.hpp>
#include <array>
#include <chrono>
#include <cstdio>
#include <random>

namespace tnid {

// Short reads count as failure; the whole buffer comes from one source.
static bool read_urandom(uint8_t* buf, size_t len) {
    std::FILE* dev = std::fopen("/dev/urandom", "rb");
    if (!dev) return false;
    size_t got = std::fread(buf, 1, len, dev);
    std::fclose(dev);
    return got == len;
}

void fill_random_bytes(uint8_t* buf, size_t len) {
    if (read_urandom(buf, len)) return;

    log::debug("/dev/urandom unavailable, using mt19937_64 fallback");
    static std::mt19937_64 gen{std::random_device{}()};
    size_t i = 0;
    while (i < len) {
        uint64_t word = gen();
        for (int k = 0; k < 8 && i < len; ++k, ++i) {
            buf[i] = static_cast<uint8_t>(word >> (8 * k));
        }
    }
}

uint64_t random_u64() {
    std::array<uint8_t, 8> bytes{};
    fill_random_bytes(bytes.data(), bytes.size());
    uint64_t v = 0;
    for (uint8_t b : bytes) {
        v = (v << 8) | b;
    }
    return v;
}

U128 random_u128() {
    std::array<uint8_t, 16> bytes{};
    fill_random_bytes(bytes.data(), bytes.size());
    return U128::from_bytes(bytes);
}

uint64_t unix_millis_now() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

} // namespace tnid
