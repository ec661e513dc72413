#include <gtest/gtest.h>

#include <set>

#include "abp/behavior/random.hpp"

using namespace abp::behavior;

TEST(RandomTest, SameStateSameDraw) {
    RngState state{1234};
    auto a = NextRandom(state);
    auto b = NextRandom(state);
    EXPECT_EQ(a.value, b.value);
    EXPECT_EQ(a.next, b.next);
    EXPECT_NE(a.next, state);
}

TEST(RandomTest, IsConstexpr) {
    constexpr auto draw = NextRandom(RngState{0});
    static_assert(draw.next.value == 0x9E3779B97F4A7C15ULL);
    EXPECT_NE(draw.value, 0u);
}

TEST(RandomTest, UnitStaysInHalfOpenInterval) {
    RandomStream rng(7);
    for (int i = 0; i < 10000; ++i) {
        double u = rng.NextUnit();
        ASSERT_GE(u, 0.0);
        ASSERT_LT(u, 1.0);
    }
}

TEST(RandomTest, UniformIntIsInclusive) {
    RandomStream rng(99);
    std::set<uint32_t> seen;
    for (int i = 0; i < 2000; ++i) {
        auto v = rng.UniformInt(2, 5);
        ASSERT_GE(v, 2u);
        ASSERT_LE(v, 5u);
        seen.insert(v);
    }
    EXPECT_EQ(seen, (std::set<uint32_t>{2, 3, 4, 5}));
}

TEST(RandomTest, DegenerateRangesReturnLowerBound) {
    RandomStream rng(3);
    EXPECT_EQ(rng.UniformInt(4, 4), 4u);
    EXPECT_DOUBLE_EQ(rng.Uniform(2.5, 2.5), 2.5);
}

TEST(RandomTest, ChanceExtremes) {
    RandomStream rng(11);
    for (int i = 0; i < 1000; ++i) {
        ASSERT_FALSE(rng.Chance(0.0));
        ASSERT_TRUE(rng.Chance(1.0));
    }
}

TEST(RandomTest, StreamsWithSameSeedAgree) {
    RandomStream a(2024);
    RandomStream b(2024);
    for (int i = 0; i < 100; ++i) {
        ASSERT_EQ(a.Next(), b.Next());
    }
    EXPECT_EQ(a.State(), b.State());
}

TEST(RandomTest, DerivedSeedsDiffer) {
    EXPECT_NE(DeriveSeed(42, 1), DeriveSeed(42, 2));
    EXPECT_EQ(DeriveSeed(42, 1), DeriveSeed(42, 1));
}
