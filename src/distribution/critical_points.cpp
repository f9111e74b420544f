/**
 * @file critical_points.cpp
 * @brief critical point extraction + epsilon dedup
 */
#include "trib/distribution/critical_points.hpp"

#include <algorithm>

namespace trib::distribution
{

auto sort_and_deduplicate(std::vector<double> values, const common::Tolerance &tol) -> std::vector<double>
{
    std::ranges::sort(values);
    std::vector<double> unique;
    unique.reserve(values.size());
    for (const double value : values)
    {
        if (unique.empty() || value - unique.back() > tol.epsilon)
        {
            unique.push_back(value);
        }
    }
    return unique;
}

auto extract_critical_points(std::span<const model::RegionalLoad> loads, std::span<const model::Beam> beams,
                             const common::Tolerance &tol) -> std::expected<CriticalPoints, model::DistributionError>
{
    if (loads.empty() && beams.empty())
    {
        return std::unexpected(model::DistributionError{model::ErrorKind::Configuration,
                                                        "nothing to distribute: no loads and no beams",
                                                        {"loads", "beams"}});
    }

    std::vector<double> coordinates;
    coordinates.reserve(loads.size() * 2U + beams.size());
    std::vector<double> boundaries;
    boundaries.reserve(beams.size() + 2U);

    for (const auto &load : loads)
    {
        coordinates.push_back(load.y_start);
        coordinates.push_back(load.y_end);
    }
    for (const auto &beam : beams)
    {
        coordinates.push_back(beam.position);
        boundaries.push_back(beam.position);
    }

    if (!loads.empty())
    {
        const auto lowest  = std::ranges::min_element(loads, {}, &model::RegionalLoad::y_start);
        const auto highest = std::ranges::max_element(loads, {}, &model::RegionalLoad::y_end);
        boundaries.push_back(lowest->y_start);
        boundaries.push_back(highest->y_end);
    }

    CriticalPoints points{};
    points.coordinates       = sort_and_deduplicate(std::move(coordinates), tol);
    points.system_boundaries = sort_and_deduplicate(std::move(boundaries), tol);
    points.system_extent     = common::Interval{points.system_boundaries.front(), points.system_boundaries.back()};
    return points;
}

} // namespace trib::distribution
