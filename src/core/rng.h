#pragma once

#include <cstdint>

namespace terravox::core {

// SplitMix64 finalizer. Spreads nearby user seeds (1, 2, 3...) across the full state space.
inline constexpr std::uint64_t mixSeed(std::uint64_t seed) {
    std::uint64_t z = seed + 0x9e3779b97f4a7c15ULL;
    z = (z ^ (z >> 30u)) * 0xbf58476d1ce4e5b9ULL;
    z = (z ^ (z >> 27u)) * 0x94d049bb133111ebULL;
    return z ^ (z >> 31u);
}

class Pcg32 {
public:
    explicit Pcg32(std::uint64_t seed = 0x853c49e6748fea9bULL) : m_state(seed) {}

    std::uint32_t nextU32() {
        const std::uint64_t old = m_state;
        m_state = old * 6364136223846793005ULL + 1442695040888963407ULL;
        const std::uint32_t xorshifted = static_cast<std::uint32_t>(((old >> 18u) ^ old) >> 27u);
        const std::uint32_t rot = static_cast<std::uint32_t>(old >> 59u);
        return (xorshifted >> rot) | (xorshifted << ((~rot + 1u) & 31u));
    }

    std::uint32_t nextBounded(std::uint32_t bound) {
        if (bound == 0u) {
            return 0u;
        }
        return static_cast<std::uint32_t>((static_cast<std::uint64_t>(nextU32()) * bound) >> 32u);
    }

    float nextFloat01() {
        return static_cast<float>(nextU32() >> 8u) * (1.0f / 16777216.0f);
    }

private:
    std::uint64_t m_state;
};

} // namespace terravox::core
