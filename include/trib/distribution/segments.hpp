/**
 * @file segments.hpp
 * @brief stage 2: chop the axis at critical points and tag each piece with its load
 *
 * every gap between neighbouring critical points is either fully inside one
 * load or inside none (critical points include every load edge). covered gaps
 * become Segments carrying the load's intensity; uncovered gaps are dropped and
 * therefore carry zero load.
 *
 * overlap policy: if several loads cover the same gap, the one with the
 * smallest y_start wins (ties keep input order). superposition is NOT applied;
 * callers that want it must pre-split their loads.
 */
#pragma once

#include <cstddef>
#include <span>
#include <vector>

#include "trib/common/tolerance.hpp"
#include "trib/model/model.hpp"

namespace trib::distribution
{

/**
 * @brief load indices sorted by ascending y_start (stable)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto order_loads(std::span<const model::RegionalLoad> loads) -> std::vector<std::size_t>;

/**
 * @brief builds covered segments between consecutive critical points
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] critical_points strictly increasing coordinates from stage 1
 * @param[in] loads regional loads (input order, indices are preserved)
 * @param[in] tol shared tolerance (gap must be wider than eps, coverage has eps slack)
 * @return ascending segments, only for gaps some load covers
 *
 * @complexity O(P * L) for P critical points and L loads
 */
[[nodiscard]] auto build_segments(std::span<const double> critical_points,
                                  std::span<const model::RegionalLoad> loads,
                                  const common::Tolerance &tol) -> std::vector<model::Segment>;

} // namespace trib::distribution
