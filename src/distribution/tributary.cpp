/**
 * @file tributary.cpp
 * @brief tributary zone assignment (midpoint rule)
 */
#include "trib/distribution/tributary.hpp"

#include <algorithm>
#include <numeric>

namespace trib::distribution
{

auto order_beams(std::span<const model::Beam> beams) -> std::vector<std::size_t>
{
    std::vector<std::size_t> order(beams.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::ranges::stable_sort(order, {}, [&beams](std::size_t index) { return beams[index].position; });
    return order;
}

auto assign_zones(std::span<const model::Beam> beams, const common::Interval &system_extent)
    -> std::vector<model::TributaryZone>
{
    const auto order = order_beams(beams);

    std::vector<model::TributaryZone> zones;
    zones.reserve(order.size());
    for (std::size_t i = 0; i < order.size(); ++i)
    {
        const double position = beams[order[i]].position;
        const double lower =
            i == 0U ? system_extent.start : common::midpoint(beams[order[i - 1U]].position, position);
        const double upper =
            i + 1U == order.size() ? system_extent.end : common::midpoint(position, beams[order[i + 1U]].position);
        zones.push_back(model::TributaryZone{.beam_index = order[i], .bounds = common::Interval{lower, upper}});
    }
    return zones;
}

} // namespace trib::distribution
