#pragma once

#include <cstdint>

// Core Noise subsystem
// Responsible for: deterministic, seed-driven 2D gradient noise and its fractal sum.
// Should NOT do: keep mutable sampling state, cache results, or decide what the values mean.
namespace terravox::core {

struct FbmParams {
    std::int32_t octaves = 4;
    double lacunarity = 2.0;
    double gain = 0.5;
};

class NoiseField {
public:
    explicit NoiseField(std::uint32_t seed) : m_seed(seed) {}

    // 2D simplex noise in [-1, 1]. Pure: the same (x, z) always yields the same value.
    [[nodiscard]] float sample(double x, double z) const;

    // Fractal sum of `sample` starting at frequency 1 and amplitude 1, normalized by the amplitude sum.
    [[nodiscard]] float fbm(double x, double z, const FbmParams& params) const;
    [[nodiscard]] float fbm(double x, double z, std::int32_t octaves, double lacunarity, double gain) const;

    [[nodiscard]] std::uint32_t seed() const { return m_seed; }

private:
    std::uint32_t m_seed;
};

} // namespace terravox::core
