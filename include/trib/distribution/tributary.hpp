/**
 * @file tributary.hpp
 * @brief stage 3: midpoint-to-neighbour tributary zones per beam
 *
 * beams get sorted by position; each one owns the half-distance to its
 * neighbours. the first beam reaches down to the system's lower boundary and
 * the last reaches up to the upper boundary, so edge supports soak up
 * everything out to the loaded region's edge. neighbouring zones share their
 * midpoint exactly (same double), which keeps the tiling gap-free.
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
 * @brief beam indices sorted by ascending position (stable)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto order_beams(std::span<const model::Beam> beams) -> std::vector<std::size_t>;

/**
 * @brief assigns the tributary zone for every beam
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] beams beams in caller order
 * @param[in] system_extent [min boundary, max boundary] from stage 1
 * @return zones in ascending beam-position order (empty when no beams)
 *
 * @post zones[i].bounds.end == zones[i + 1].bounds.start for all i
 * @post zones.front().bounds.start == system_extent.start and
 *       zones.back().bounds.end == system_extent.end
 */
[[nodiscard]] auto assign_zones(std::span<const model::Beam> beams, const common::Interval &system_extent)
    -> std::vector<model::TributaryZone>;

} // namespace trib::distribution
