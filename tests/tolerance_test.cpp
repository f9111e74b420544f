/**
 * @file tolerance_test.cpp
 * @brief interval + epsilon helpers
 */
#include <gtest/gtest.h>
#include <limits>

#include "trib/common/tolerance.hpp"

namespace
{

using trib::common::Interval;
using trib::common::Tolerance;

constexpr Tolerance kTol{};

static_assert(trib::common::midpoint(0.0, 1.0) == 0.5);
static_assert(trib::common::width(Interval{0.2, 1.0}) > 0.79);
static_assert(trib::common::nearly_equal(0.2, 0.2 + 1.0e-12, kTol));

} // namespace

/**
 * @test contains() tolerates edge jitter smaller than epsilon
 */
TEST(CommonTolerance, ContainsAcceptsSubEpsilonJitter)
{
    const Interval outer{0.2, 1.0};
    EXPECT_TRUE(trib::common::contains(outer, Interval{0.2 - 5.0e-10, 0.6}, kTol));
    EXPECT_TRUE(trib::common::contains(outer, Interval{0.6, 1.0 + 5.0e-10}, kTol));
    EXPECT_FALSE(trib::common::contains(outer, Interval{0.1, 0.6}, kTol));
    EXPECT_FALSE(trib::common::contains(outer, Interval{0.6, 1.1}, kTol));
}

/**
 * @test intersect() clips to the common part and flags disjoint inputs as degenerate
 */
TEST(CommonTolerance, IntersectClipsAndDetectsDisjoint)
{
    const auto overlap = trib::common::intersect(Interval{0.0, 1.0}, Interval{0.6, 2.0});
    EXPECT_DOUBLE_EQ(overlap.start, 0.6);
    EXPECT_DOUBLE_EQ(overlap.end, 1.0);
    EXPECT_TRUE(trib::common::has_extent(overlap, kTol));

    const auto touching = trib::common::intersect(Interval{0.0, 1.0}, Interval{1.0, 2.0});
    EXPECT_FALSE(trib::common::has_extent(touching, kTol));

    const auto disjoint = trib::common::intersect(Interval{0.0, 1.0}, Interval{1.5, 2.0});
    EXPECT_LT(trib::common::width(disjoint), 0.0);
    EXPECT_FALSE(trib::common::has_extent(disjoint, kTol));
}

/**
 * @test zero tolerance turns the helpers into exact comparisons
 */
TEST(CommonTolerance, ZeroEpsilonIsExact)
{
    constexpr Tolerance exact{.epsilon = 0.0};
    EXPECT_FALSE(trib::common::nearly_equal(0.2, 0.2 + 1.0e-12, exact));
    EXPECT_FALSE(trib::common::has_extent(Interval{1.0, 1.0}, exact));
    EXPECT_TRUE(trib::common::has_extent(Interval{1.0, 1.0 + 1.0e-12}, exact));
}

TEST(CommonTolerance, IsFiniteRejectsNanAndInfinity)
{
    EXPECT_TRUE(trib::common::is_finite(Interval{-1.0, 1.0}));
    EXPECT_FALSE(trib::common::is_finite(Interval{std::numeric_limits<double>::quiet_NaN(), 1.0}));
    EXPECT_FALSE(trib::common::is_finite(Interval{0.0, std::numeric_limits<double>::infinity()}));
}
