#include "core/noise_field.h"

#include <algorithm>
#include <cmath>
#include <cstdint>

namespace terravox::core {
namespace {

// Skew/unskew factors between the input square lattice and the simplex (triangle) lattice.
constexpr double kSkew2 = 0.36602540378443864676;   // (sqrt(3) - 1) / 2
constexpr double kUnskew2 = 0.21132486540518711775; // (3 - sqrt(3)) / 6
constexpr double kSimplexScale = 70.0;

std::uint32_t hash2i(std::int32_t x, std::int32_t z, std::uint32_t seed) {
    std::uint32_t h = seed;
    h ^= static_cast<std::uint32_t>(x) * 0x8da6b343u;
    h ^= static_cast<std::uint32_t>(z) * 0xcb1ab31fu;
    h ^= (h >> 13u);
    h *= 0x85ebca6bu;
    h ^= (h >> 16u);
    return h;
}

double gradDot(std::uint32_t h, double x, double z) {
    switch (h & 0x7u) {
        case 0x0u:
            return x + z;
        case 0x1u:
            return -x + z;
        case 0x2u:
            return x - z;
        case 0x3u:
            return -x - z;
        case 0x4u:
            return x;
        case 0x5u:
            return -x;
        case 0x6u:
            return z;
        default:
            return -z;
    }
}

double cornerContribution(std::uint32_t h, double x, double z) {
    double falloff = 0.5 - (x * x) - (z * z);
    if (falloff <= 0.0) {
        return 0.0;
    }
    falloff *= falloff;
    return falloff * falloff * gradDot(h, x, z);
}

} // namespace

float NoiseField::sample(double x, double z) const {
    const double skew = (x + z) * kSkew2;
    const std::int32_t i = static_cast<std::int32_t>(std::floor(x + skew));
    const std::int32_t j = static_cast<std::int32_t>(std::floor(z + skew));
    const double unskew = static_cast<double>(i + j) * kUnskew2;
    const double x0 = x - (static_cast<double>(i) - unskew);
    const double z0 = z - (static_cast<double>(j) - unskew);

    // Upper or lower triangle of the skewed cell.
    const std::int32_t i1 = (x0 > z0) ? 1 : 0;
    const std::int32_t j1 = (x0 > z0) ? 0 : 1;

    const double x1 = x0 - static_cast<double>(i1) + kUnskew2;
    const double z1 = z0 - static_cast<double>(j1) + kUnskew2;
    const double x2 = x0 - 1.0 + (2.0 * kUnskew2);
    const double z2 = z0 - 1.0 + (2.0 * kUnskew2);

    const double n0 = cornerContribution(hash2i(i, j, m_seed), x0, z0);
    const double n1 = cornerContribution(hash2i(i + i1, j + j1, m_seed), x1, z1);
    const double n2 = cornerContribution(hash2i(i + 1, j + 1, m_seed), x2, z2);

    const double value = kSimplexScale * (n0 + n1 + n2);
    return static_cast<float>(std::clamp(value, -1.0, 1.0));
}

float NoiseField::fbm(double x, double z, const FbmParams& params) const {
    double frequency = 1.0;
    double amplitude = 1.0;
    double amplitudeSum = 0.0;
    double valueSum = 0.0;
    for (std::int32_t octave = 0; octave < params.octaves; ++octave) {
        valueSum += amplitude * static_cast<double>(sample(x * frequency, z * frequency));
        amplitudeSum += amplitude;
        frequency *= params.lacunarity;
        amplitude *= params.gain;
    }
    if (amplitudeSum <= 0.0) {
        return 0.0f;
    }
    return static_cast<float>(valueSum / amplitudeSum);
}

float NoiseField::fbm(double x, double z, std::int32_t octaves, double lacunarity, double gain) const {
    return fbm(x, z, FbmParams{octaves, lacunarity, gain});
}

} // namespace terravox::core
