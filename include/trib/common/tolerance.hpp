/**
 * @file tolerance.hpp
 * @brief one shared epsilon + interval helpers so boundary checks never disagree uwu
 *
 * every stage of the tributary pipeline (critical point dedup, segment
 * coverage tests, overlap clipping) compares floating point coordinates. if
 * those stages used different fudge factors, a load edge could count as
 * "touching" in one place and "apart" in another, and the whole decomposition
 * would go feral. so this header owns the single Tolerance knob plus tiny pure
 * helpers that read it. no third-party deps, just crisp STL + constexpr ✨
 *
 * @author LukeFrankio
 * @date 2025-11-05
 * @version 1.0
 *
 * @note compiled with GCC 15.2+ in -std=c++2c mode (C++26 baby!)
 * @note zero allocations anywhere in here
 *
 * example (basic usage):
 * @code
 * using namespace trib::common;
 * constexpr Tolerance tol{};
 * constexpr Interval lhs{0.0, 1.0};
 * constexpr Interval rhs{0.6, 2.0};
 * constexpr auto overlap = intersect(lhs, rhs);
 * // overlap == {0.6, 1.0}, width(overlap) == 0.4 and the compiler folds it uwu
 * @endcode
 */
#pragma once

#include <algorithm>
#include <cmath>
#include <numeric>

namespace trib::common
{

/**
 * @brief default epsilon used for coordinate comparisons [length units]
 */
inline constexpr double kDefaultEpsilon = 1.0e-9;

/**
 * @brief the one tolerance knob shared by every pipeline stage
 *
 * ✨ PURE FUNCTION ✨ (plain value type)
 *
 * callers tweak epsilon when their coordinates live at a wildly different
 * scale (mm vs km). must be finite and >= 0, calculator validates that.
 */
struct Tolerance
{
    double epsilon{kDefaultEpsilon}; ///< absolute coordinate tolerance
};

/**
 * @brief half-open interval [start, end) along the transverse axis
 */
struct Interval
{
    double start{0.0}; ///< lower edge
    double end{0.0};   ///< upper edge (exclusive for coverage purposes)
};

/**
 * @brief interval width (negative when the interval is inverted)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto width(const Interval &interval) noexcept -> double
{
    return interval.end - interval.start;
}

/**
 * @brief midpoint of two coordinates, the tributary split rule in one line
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] lhs first coordinate
 * @param[in] rhs second coordinate
 * @return (lhs + rhs) / 2, finite for any two finite inputs
 */
[[nodiscard]] constexpr auto midpoint(double lhs, double rhs) noexcept -> double
{
    return std::midpoint(lhs, rhs);
}

/**
 * @brief true when two coordinates sit within epsilon of each other
 *
 * ✨ PURE FUNCTION ✨
 *
 * this function is pure because:
 * - same inputs always give the same answer, nothing global is read
 * - constexpr friendly so tests can static_assert it
 */
[[nodiscard]] constexpr auto nearly_equal(double lhs, double rhs, const Tolerance &tol) noexcept -> bool
{
    const double delta = lhs > rhs ? lhs - rhs : rhs - lhs;
    return delta <= tol.epsilon;
}

/**
 * @brief true when the interval is wider than epsilon (non-degenerate)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] constexpr auto has_extent(const Interval &interval, const Tolerance &tol) noexcept -> bool
{
    return width(interval) > tol.epsilon;
}

/**
 * @brief true when `outer` contains `inner` with epsilon slack on both edges
 *
 * ✨ PURE FUNCTION ✨
 *
 * outer.start <= inner.start + eps and outer.end >= inner.end - eps. the slack
 * is what lets two loads that share an edge (0.2 vs 0.2000000001) both claim
 * their own side of the boundary without leaving a sliver behind.
 */
[[nodiscard]] constexpr auto contains(const Interval &outer, const Interval &inner,
                                      const Tolerance &tol) noexcept -> bool
{
    return outer.start <= inner.start + tol.epsilon && outer.end >= inner.end - tol.epsilon;
}

/**
 * @brief clipped overlap of two intervals (may come back inverted)
 *
 * ✨ PURE FUNCTION ✨
 *
 * @return [max(starts), min(ends)); callers test has_extent() before trusting it
 */
[[nodiscard]] constexpr auto intersect(const Interval &lhs, const Interval &rhs) noexcept -> Interval
{
    return Interval{std::max(lhs.start, rhs.start), std::min(lhs.end, rhs.end)};
}

/**
 * @brief finite-ness check for a whole interval
 */
[[nodiscard]] inline auto is_finite(const Interval &interval) noexcept -> bool
{
    return std::isfinite(interval.start) && std::isfinite(interval.end);
}

} // namespace trib::common
