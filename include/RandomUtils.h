#pragma once

#include <cstddef>
#include <cstdint>
#include <random>

// Draw helpers over a caller-owned engine. Each call consumes a fixed number of
// 32-bit outputs so a seeded sequence replays identically on every platform;
// std::uniform_*_distribution gives no such guarantee.
namespace RandomUtils {

// 53-bit double in [0, 1) built from two 32-bit outputs.
inline double uniformUnit(std::mt19937& rng) {
    const uint32_t a = static_cast<uint32_t>(rng()) >> 5;
    const uint32_t b = static_cast<uint32_t>(rng()) >> 6;
    return (static_cast<double>(a) * 67108864.0 + static_cast<double>(b)) * (1.0 / 9007199254740992.0);
}

// Uniform bit position in [0, 8) from the top three bits of one output.
inline int bitIndex(std::mt19937& rng) {
    return static_cast<int>(static_cast<uint32_t>(rng()) >> 29);
}

/**
 * @brief Uniform index in [0, n) by rejection on the smallest covering bit width.
 * @post n <= 1 returns 0 without consuming the engine.
 */
inline size_t uniformIndex(std::mt19937& rng, size_t n) {
    if (n <= 1) return 0;
    const uint64_t limit = static_cast<uint64_t>(n);
    int bits = 0;
    while ((uint64_t{1} << bits) < limit) ++bits;
    for (;;) {
        uint64_t draw = static_cast<uint32_t>(rng());
        if (bits > 32) draw = (draw << 32) | static_cast<uint32_t>(rng());
        const int width = bits > 32 ? 64 : 32;
        draw >>= (width - bits);
        if (draw < limit) return static_cast<size_t>(draw);
    }
}

}
