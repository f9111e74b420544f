/**
 * @file segments.cpp
 * @brief segment builder with first-match-wins coverage
 */
#include "trib/distribution/segments.hpp"

#include <algorithm>
#include <numeric>
#include <optional>

namespace trib::distribution
{
namespace
{

[[nodiscard]] auto find_covering_load(const common::Interval &gap, std::span<const model::RegionalLoad> loads,
                                      std::span<const std::size_t> order, const common::Tolerance &tol)
    -> std::optional<std::size_t>
{
    for (const auto index : order)
    {
        if (common::contains(model::extent(loads[index]), gap, tol))
        {
            return index;
        }
    }
    return std::nullopt;
}

} // namespace

auto order_loads(std::span<const model::RegionalLoad> loads) -> std::vector<std::size_t>
{
    std::vector<std::size_t> order(loads.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::ranges::stable_sort(order, {}, [&loads](std::size_t index) { return loads[index].y_start; });
    return order;
}

auto build_segments(std::span<const double> critical_points, std::span<const model::RegionalLoad> loads,
                    const common::Tolerance &tol) -> std::vector<model::Segment>
{
    std::vector<model::Segment> segments;
    if (critical_points.size() < 2U || loads.empty())
    {
        return segments;
    }

    const auto order = order_loads(loads);
    segments.reserve(critical_points.size() - 1U);
    for (std::size_t i = 1; i < critical_points.size(); ++i)
    {
        const common::Interval gap{critical_points[i - 1U], critical_points[i]};
        if (!common::has_extent(gap, tol))
        {
            continue;
        }
        const auto owner = find_covering_load(gap, loads, order, tol);
        if (!owner)
        {
            continue;
        }
        const auto &load = loads[*owner];
        segments.push_back(model::Segment{.span       = gap,
                                          .intensity  = load.intensity,
                                          .load_name  = load.name,
                                          .load_index = *owner});
    }
    return segments;
}

} // namespace trib::distribution
