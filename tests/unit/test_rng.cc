#include <gtest/gtest.h>

#include <cstdint>
#include <vector>

#include "core/rng.h"
#include "core/sampling.h"

namespace strata {

TEST(RNGTest, UniformDoubleStaysInUnitInterval) {
    RNG rng(42);
    for (int i = 0; i < 1000000; ++i) {
        Float u = rng.UniformDouble();
        ASSERT_GE(u, 0.0);
        ASSERT_LT(u, 1.0);
    }
}

TEST(RNGTest, SameSeedReproducesSequence) {
    RNG a(1234);
    RNG b(1234);
    for (int i = 0; i < 1000; ++i) {
        ASSERT_EQ(a.NextUInt64(), b.NextUInt64());
    }
}

TEST(RNGTest, DifferentSeedsDiverge) {
    RNG a(1);
    RNG b(2);
    int equal = 0;
    for (int i = 0; i < 64; ++i) {
        if (a.NextUInt64() == b.NextUInt64()) ++equal;
    }
    EXPECT_EQ(equal, 0);
}

TEST(RNGTest, GoldenRatioStreamsDiverge) {
    RNG a(7);
    RNG b(7 + kGoldenRatio);
    bool differs = false;
    for (int i = 0; i < 64 && !differs; ++i) {
        differs = a.NextUInt64() != b.NextUInt64();
    }
    EXPECT_TRUE(differs);
}

TEST(RNGTest, UniformUInt64RespectsBoundAndCoversRange) {
    RNG rng(99);
    std::vector<int> counts(6, 0);
    for (int i = 0; i < 60000; ++i) {
        uint64_t v = rng.UniformUInt64(6);
        ASSERT_LT(v, 6u);
        ++counts[v];
    }
    // Expect ~10000 each; a biased or broken generator is far off
    for (int c : counts) {
        EXPECT_GT(c, 9000);
        EXPECT_LT(c, 11000);
    }
}

TEST(RNGTest, UniformDoubleRange) {
    RNG rng(5);
    for (int i = 0; i < 10000; ++i) {
        Float u = rng.UniformDouble(-2.0, 3.0);
        ASSERT_GE(u, -2.0);
        ASSERT_LT(u, 3.0);
    }
}

TEST(RNGTest, SplitMix64AdvancesState) {
    uint64_t state = 0;
    uint64_t first = SplitMix64(&state);
    uint64_t second = SplitMix64(&state);
    EXPECT_NE(first, second);
    EXPECT_EQ(state, 2 * 0x9e3779b97f4a7c15ULL);
}

// ============================================================================
// Sampling helpers
// ============================================================================

TEST(SamplingTest, RandomUnitVectorIsUnitLength) {
    RNG rng(3);
    for (int i = 0; i < 10000; ++i) {
        EXPECT_NEAR(RandomUnitVector(rng).Length(), 1.0, 1e-12);
    }
}

TEST(SamplingTest, RandomInUnitDiskStaysInDisk) {
    RNG rng(4);
    for (int i = 0; i < 10000; ++i) {
        Vec3 p = RandomInUnitDisk(rng);
        EXPECT_LT(p.LengthSquared(), 1.0);
        EXPECT_EQ(p.z(), 0.0);
    }
}

TEST(SamplingTest, SampleSquareStaysInPixel) {
    RNG rng(6);
    for (int i = 0; i < 10000; ++i) {
        Vec3 p = SampleSquare(rng);
        EXPECT_GE(p.x(), -0.5);
        EXPECT_LT(p.x(), 0.5);
        EXPECT_GE(p.y(), -0.5);
        EXPECT_LT(p.y(), 0.5);
    }
}

}  // namespace strata
