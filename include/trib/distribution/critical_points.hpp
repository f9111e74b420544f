/**
 * @file critical_points.hpp
 * @brief stage 1 of the tributary pipeline: collect every coordinate that matters
 *
 * load edges and beam positions are the only places where coverage or beam
 * responsibility can change, so the axis gets chopped exactly there. the
 * extractor also reports the system boundary set (beam positions + loaded
 * region extremes) whose min/max clamp the outermost tributary zones.
 *
 * @note requires GCC 15.2+ with -std=c++2c for std::expected
 */
#pragma once

#include <expected>
#include <span>
#include <vector>

#include "trib/common/tolerance.hpp"
#include "trib/model/model.hpp"

namespace trib::distribution
{

/**
 * @brief sorted coordinate sets produced by the extractor
 */
struct CriticalPoints
{
    std::vector<double> coordinates;       ///< load edges + beam positions, sorted + eps-deduplicated
    std::vector<double> system_boundaries; ///< beam positions + loaded extremes, sorted + deduplicated
    common::Interval    system_extent;     ///< [front, back] of system_boundaries
};

/**
 * @brief sorts then collapses runs of values closer than epsilon
 *
 * ✨ PURE FUNCTION ✨
 *
 * the first value of every near-equal run survives, so the output is strictly
 * increasing with gaps > epsilon between neighbours.
 *
 * @param[in] values unsorted coordinates (taken by value, sorted in place)
 * @param[in] tol shared tolerance
 * @return strictly increasing coordinates
 */
[[nodiscard]] auto sort_and_deduplicate(std::vector<double> values, const common::Tolerance &tol)
    -> std::vector<double>;

/**
 * @brief extracts critical points and system boundaries from loads + beams
 *
 * ✨ PURE FUNCTION ✨
 *
 * system boundaries = every beam position plus min(y_start)/max(y_end) over
 * the loads; with no loads the beam extremes stand in (they are already in the
 * set). with no beams, the loaded extremes alone define the system.
 *
 * @param[in] loads regional loads (may be empty if beams are not)
 * @param[in] beams beams (may be empty if loads are not)
 * @param[in] tol shared tolerance
 * @return CriticalPoints or a Configuration error when both inputs are empty
 */
[[nodiscard]] auto extract_critical_points(std::span<const model::RegionalLoad> loads,
                                           std::span<const model::Beam> beams,
                                           const common::Tolerance &tol)
    -> std::expected<CriticalPoints, model::DistributionError>;

} // namespace trib::distribution
