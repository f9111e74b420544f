/**
 * @file contributions.hpp
 * @brief stage 4: clip every segment against every tributary zone and itemize
 *
 * contributions are NOT merged per load: if a load spans several segments
 * inside one zone, the beam gets one contribution per segment so reports can
 * show exactly which interval each kN/m came from.
 */
#pragma once

#include <span>
#include <vector>

#include "trib/common/tolerance.hpp"
#include "trib/model/model.hpp"

namespace trib::distribution
{

/**
 * @brief itemized contributions of all segments to one tributary zone
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] zone beam tributary interval
 * @param[in] segments ascending covered segments from stage 2
 * @param[in] tol overlaps no wider than eps are skipped
 * @return contributions ascending by start coordinate
 */
[[nodiscard]] auto collect_contributions(const common::Interval &zone, std::span<const model::Segment> segments,
                                         const common::Tolerance &tol) -> std::vector<model::Contribution>;

/**
 * @brief builds one fresh BeamResult per zone (ascending position order)
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] beams beams in caller order (zones index into it)
 * @param[in] zones ascending zones from stage 3
 * @param[in] segments ascending segments from stage 2
 * @param[in] tol shared tolerance
 * @return BeamResults, totals accumulated in contribution order
 */
[[nodiscard]] auto distribute(std::span<const model::Beam> beams,
                              std::span<const model::TributaryZone> zones,
                              std::span<const model::Segment> segments,
                              const common::Tolerance &tol) -> std::vector<model::BeamResult>;

} // namespace trib::distribution
