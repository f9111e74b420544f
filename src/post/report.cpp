/**
 * @file report.cpp
 * @brief text report + coverage diagnostics implementation uwu
 */
#include "trib/post/report.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <iterator>

#include "trib/distribution/segments.hpp"

namespace trib::post
{
namespace
{

[[nodiscard]] auto find_gaps(std::span<const model::RegionalLoad> loads, const model::DistributionResult &result)
    -> std::vector<common::Interval>
{
    std::vector<common::Interval> gaps;
    if (loads.empty())
    {
        return gaps;
    }
    const auto &tol     = result.details.tolerance;
    const auto  lowest  = std::ranges::min_element(loads, {}, &model::RegionalLoad::y_start);
    const auto  highest = std::ranges::max_element(loads, {}, &model::RegionalLoad::y_end);

    double cursor = lowest->y_start;
    for (const auto &segment : result.details.segments)
    {
        const common::Interval gap{cursor, segment.span.start};
        if (common::has_extent(gap, tol))
        {
            gaps.push_back(gap);
        }
        cursor = std::max(cursor, segment.span.end);
    }
    const common::Interval tail{cursor, highest->y_end};
    if (common::has_extent(tail, tol))
    {
        gaps.push_back(tail);
    }
    return gaps;
}

[[nodiscard]] auto find_overlaps(std::span<const model::RegionalLoad> loads, const common::Tolerance &tol)
    -> std::vector<LoadOverlap>
{
    const auto               order = distribution::order_loads(loads);
    std::vector<LoadOverlap> overlaps;
    for (std::size_t i = 0; i < order.size(); ++i)
    {
        for (std::size_t j = i + 1U; j < order.size(); ++j)
        {
            const auto &first  = loads[order[i]];
            const auto &second = loads[order[j]];
            const auto  span   = common::intersect(model::extent(first), model::extent(second));
            if (common::has_extent(span, tol))
            {
                overlaps.push_back(LoadOverlap{.winner = first.name, .loser = second.name, .span = span});
            }
        }
    }
    return overlaps;
}

} // namespace

auto summarize_by_load(const model::BeamResult &beam) -> std::vector<LoadShare>
{
    std::vector<LoadShare> shares;
    for (const auto &contribution : beam.contributions)
    {
        auto iter = std::ranges::find(shares, contribution.load_name, &LoadShare::load_name);
        if (iter == shares.end())
        {
            shares.push_back(LoadShare{.load_name = contribution.load_name, .width = 0.0, .value = 0.0});
            iter = std::prev(shares.end());
        }
        iter->width += contribution.width;
        iter->value += contribution.value;
    }
    return shares;
}

auto check_coverage(std::span<const model::RegionalLoad> loads, const model::DistributionResult &result)
    -> CoverageDiagnostics
{
    CoverageDiagnostics diagnostics{};
    diagnostics.gaps     = find_gaps(loads, result);
    diagnostics.overlaps = find_overlaps(loads, result.details.tolerance);

    double magnitude = 0.0;
    for (const auto &load : loads)
    {
        const double applied = load.intensity * model::width(load);
        diagnostics.applied_total += applied;
        magnitude += std::abs(applied);
    }
    for (const auto &beam : result.beams)
    {
        diagnostics.distributed_total += beam.total;
    }

    const double slack   = result.details.tolerance.epsilon * std::max(1.0, magnitude);
    diagnostics.balanced = std::abs(diagnostics.applied_total - diagnostics.distributed_total) <= slack;
    diagnostics.undistributed = !loads.empty() && result.beams.empty();
    return diagnostics;
}

auto format_report(std::span<const model::RegionalLoad> loads, const model::DistributionResult &result,
                   const CoverageDiagnostics &diagnostics, const config::Units &units) -> std::string
{
    const auto &len     = units.length;
    const auto  line_ld = std::format("{}/{}", units.force, units.length);
    const auto  area_ld = std::format("{}/{}^2", units.force, units.length);

    std::string out;
    auto        sink = std::back_inserter(out);

    std::format_to(sink, "--- TRIBUTARY LOAD DISTRIBUTION ---\n");
    std::format_to(sink, "loads: {}, beams: {}, system extent: [{:.3f}, {:.3f}] {}, loaded width: {:.3f} {}\n",
                   loads.size(), result.beams.size(), result.details.system_extent.start,
                   result.details.system_extent.end, len, result.details.loaded_width, len);

    for (const auto &load : loads)
    {
        std::format_to(sink, "  load {}: q = {:.3f} {} on [{:.3f}, {:.3f}) {} (width {:.3f} {})\n", load.name,
                       load.intensity, area_ld, load.y_start, load.y_end, len, model::width(load), len);
    }

    for (const auto &beam : result.beams)
    {
        std::format_to(sink, "\nBeam: {} @ y = {:.3f} {}\n", beam.beam_name, beam.position, len);
        std::format_to(sink, "  tributary zone: [{:.3f}, {:.3f}] {} (width {:.3f} {})\n", beam.zone.start,
                       beam.zone.end, len, common::width(beam.zone), len);
        for (const auto &contribution : beam.contributions)
        {
            std::format_to(sink, "  from {} on [{:.3f}, {:.3f}): width {:.3f} {} -> {:.3f} {}\n",
                           contribution.load_name, contribution.start, contribution.end, contribution.width, len,
                           contribution.value, line_ld);
        }
        const auto shares = summarize_by_load(beam);
        if (shares.size() < beam.contributions.size())
        {
            for (const auto &share : shares)
            {
                std::format_to(sink, "  {} subtotal: width {:.3f} {} -> {:.3f} {}\n", share.load_name,
                               share.width, len, share.value, line_ld);
            }
        }
        if (beam.contributions.empty())
        {
            std::format_to(sink, "  (no load inside tributary zone)\n");
        }
        std::format_to(sink, "  total distributed load: {:.3f} {}\n", beam.total, line_ld);
    }

    std::format_to(sink, "\napplied: {:.3f} {}  distributed: {:.3f} {}  ({})\n", diagnostics.applied_total,
                   line_ld, diagnostics.distributed_total, line_ld,
                   diagnostics.balanced ? "balanced" : "MISMATCH");
    if (diagnostics.undistributed)
    {
        std::format_to(sink, "warning: no beams, all load is undistributed\n");
    }
    for (const auto &gap : diagnostics.gaps)
    {
        std::format_to(sink, "warning: no load covers [{:.3f}, {:.3f}) {} (width {:.3f} {}), carried as zero\n",
                       gap.start, gap.end, len, common::width(gap), len);
    }
    for (const auto &overlap : diagnostics.overlaps)
    {
        std::format_to(sink, "warning: {} overlaps {} on [{:.3f}, {:.3f}) {}, {} wins (no superposition)\n",
                       overlap.winner, overlap.loser, overlap.span.start, overlap.span.end, len, overlap.winner);
    }
    std::format_to(sink, "-----------------------------------\n");
    return out;
}

} // namespace trib::post
