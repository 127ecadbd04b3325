#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

// Simple, fast RNG with deterministic cross-platform behavior.
// Not cryptographically secure.
struct RNG {
    uint32_t state;

    explicit RNG(uint32_t seed = 0x12345678u) : state(seed ? seed : 0x12345678u) {}

    uint32_t nextU32() {
        // xorshift32
        uint32_t x = state;
        x ^= x << 13;
        x ^= x >> 17;
        x ^= x << 5;
        state = x;
        return x;
    }

    int range(int lo, int hiInclusive) {
        if (hiInclusive <= lo) return lo;
        uint32_t span = static_cast<uint32_t>(hiInclusive - lo + 1);
        return lo + static_cast<int>(nextU32() % span);
    }

    // Uniform pick from a small fixed table.
    template <typename T, std::size_t N>
    const T& pick(const std::array<T, N>& table) {
        static_assert(N > 0, "pick() needs a non-empty table");
        return table[static_cast<std::size_t>(range(0, static_cast<int>(N) - 1))];
    }
};

// A tiny integer hash for stable variation (cell hashing, seed mixing).
inline uint32_t hash32(uint32_t x) {
    // Thomas Wang-ish mix
    x ^= x >> 16;
    x *= 0x7feb352du;
    x ^= x >> 15;
    x *= 0x846ca68bu;
    x ^= x >> 16;
    return x;
}

inline uint32_t hashCombine(uint32_t a, uint32_t b) {
    return hash32(a ^ (b + 0x9e3779b9u + (a << 6) + (a >> 2)));
}

// Spreads a low-entropy value (tick counts, small user seeds) over all 32 bits.
// Never returns 0, which xorshift32 cannot use as a state.
inline uint32_t mixSeed(uint32_t raw) {
    const uint32_t h = hash32(raw ^ 0x9e3779b9u);
    return h ? h : 0x12345678u;
}
