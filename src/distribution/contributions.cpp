/**
 * @file contributions.cpp
 * @brief zone x segment overlap accumulation
 */
#include "trib/distribution/contributions.hpp"

namespace trib::distribution
{

auto collect_contributions(const common::Interval &zone, std::span<const model::Segment> segments,
                           const common::Tolerance &tol) -> std::vector<model::Contribution>
{
    std::vector<model::Contribution> contributions;
    for (const auto &segment : segments)
    {
        const auto overlap = common::intersect(zone, segment.span);
        if (!common::has_extent(overlap, tol))
        {
            continue;
        }
        const double overlap_width = common::width(overlap);
        contributions.push_back(model::Contribution{.load_name = segment.load_name,
                                                    .start     = overlap.start,
                                                    .end       = overlap.end,
                                                    .width     = overlap_width,
                                                    .value     = segment.intensity * overlap_width});
    }
    return contributions;
}

auto distribute(std::span<const model::Beam> beams, std::span<const model::TributaryZone> zones,
                std::span<const model::Segment> segments, const common::Tolerance &tol)
    -> std::vector<model::BeamResult>
{
    std::vector<model::BeamResult> results;
    results.reserve(zones.size());
    for (const auto &zone : zones)
    {
        const auto &beam = beams[zone.beam_index];

        model::BeamResult result{};
        result.beam_name     = beam.name;
        result.position      = beam.position;
        result.length        = beam.length;
        result.beam_index    = zone.beam_index;
        result.zone          = zone.bounds;
        result.contributions = collect_contributions(zone.bounds, segments, tol);
        for (const auto &contribution : result.contributions)
        {
            result.total += contribution.value;
        }
        results.push_back(std::move(result));
    }
    return results;
}

} // namespace trib::distribution
