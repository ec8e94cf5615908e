#include <gtest/gtest.h>

#include <algorithm>
#include <cstdint>

#include "core/noise_field.h"

namespace {

using terravox::core::FbmParams;
using terravox::core::NoiseField;

} // namespace

TEST(NoiseField, SameSeedSamplesIdentically) {
    const NoiseField a(1234u);
    const NoiseField b(1234u);
    for (int zi = -20; zi <= 20; ++zi) {
        for (int xi = -20; xi <= 20; ++xi) {
            const double x = static_cast<double>(xi) * 0.731;
            const double z = static_cast<double>(zi) * 0.417;
            EXPECT_EQ(a.sample(x, z), b.sample(x, z));
            EXPECT_EQ(a.fbm(x, z, FbmParams{}), b.fbm(x, z, FbmParams{}));
        }
    }
}

TEST(NoiseField, RepeatedSampleIsStable) {
    const NoiseField field(99u);
    const float first = field.sample(12.34, -56.78);
    for (int i = 0; i < 16; ++i) {
        EXPECT_EQ(field.sample(12.34, -56.78), first);
    }
}

TEST(NoiseField, SamplesStayInUnitRange) {
    const NoiseField field(7u);
    float minValue = 1.0f;
    float maxValue = -1.0f;
    for (int zi = -60; zi <= 60; ++zi) {
        for (int xi = -60; xi <= 60; ++xi) {
            const float value = field.sample(static_cast<double>(xi) * 0.173, static_cast<double>(zi) * 0.219);
            ASSERT_GE(value, -1.0f);
            ASSERT_LE(value, 1.0f);
            minValue = std::min(minValue, value);
            maxValue = std::max(maxValue, value);
        }
    }
    // Gradient noise over ~20 lattice cells should swing well away from zero in both directions.
    EXPECT_LT(minValue, -0.3f);
    EXPECT_GT(maxValue, 0.3f);
}

TEST(NoiseField, DifferentSeedsDiffer) {
    const NoiseField a(1u);
    const NoiseField b(2u);
    int differing = 0;
    for (int i = 0; i < 64; ++i) {
        const double x = 0.37 * static_cast<double>(i) + 0.11;
        const double z = -0.53 * static_cast<double>(i) + 0.29;
        if (a.sample(x, z) != b.sample(x, z)) {
            ++differing;
        }
    }
    EXPECT_GT(differing, 32);
}

TEST(NoiseField, SingleOctaveFbmMatchesSample) {
    const NoiseField field(55u);
    for (int i = 0; i < 32; ++i) {
        const double x = 1.3 * static_cast<double>(i);
        const double z = 0.7 * static_cast<double>(i) - 4.0;
        EXPECT_FLOAT_EQ(field.fbm(x, z, 1, 2.0, 0.5), field.sample(x, z));
    }
}

TEST(NoiseField, FbmIsNormalizedAndOverloadsAgree) {
    const NoiseField field(314u);
    const FbmParams params{3, 2.0, 0.6};
    for (int i = 0; i < 128; ++i) {
        const double x = 0.0075 * static_cast<double>(i * 7) + 100.0;
        const double z = 0.0075 * static_cast<double>(i * 3) + 100.0;
        const float value = field.fbm(x, z, params);
        EXPECT_GE(value, -1.0f);
        EXPECT_LE(value, 1.0f);
        EXPECT_EQ(value, field.fbm(x, z, params.octaves, params.lacunarity, params.gain));
    }
}

TEST(NoiseField, ZeroOctavesYieldZero) {
    const NoiseField field(8u);
    EXPECT_EQ(field.fbm(3.0, 4.0, 0, 2.0, 0.5), 0.0f);
}
