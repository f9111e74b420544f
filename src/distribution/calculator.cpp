/**
 * @file calculator.cpp
 * @brief pipeline glue: validate, extract, segment, assign, contribute
 */
#include "trib/distribution/calculator.hpp"

#include <cmath>
#include <format>
#include <string>
#include <vector>

#include "trib/distribution/contributions.hpp"
#include "trib/distribution/critical_points.hpp"
#include "trib/distribution/segments.hpp"
#include "trib/distribution/tributary.hpp"

namespace trib::distribution
{
namespace
{

[[nodiscard]] auto make_error(model::ErrorKind kind, std::string message, std::vector<std::string> ctx)
    -> std::expected<void, model::DistributionError>
{
    return std::unexpected(model::DistributionError{kind, std::move(message), std::move(ctx)});
}

[[nodiscard]] auto validate_load(const model::RegionalLoad &load, std::size_t index)
    -> std::expected<void, model::DistributionError>
{
    const auto slot = std::format("[{}]", index);
    if (!std::isfinite(load.intensity))
    {
        return make_error(model::ErrorKind::InvalidLoad,
                          std::format("load '{}' has a non-finite intensity", load.name),
                          {"loads", slot, "intensity"});
    }
    if (!common::is_finite(model::extent(load)))
    {
        return make_error(model::ErrorKind::InvalidLoad,
                          std::format("load '{}' has non-finite edges", load.name), {"loads", slot});
    }
    if (model::width(load) < 0.0)
    {
        return make_error(model::ErrorKind::InvalidLoad,
                          std::format("load '{}' has y_end < y_start ({} < {})", load.name, load.y_end,
                                      load.y_start),
                          {"loads", slot, "y_end"});
    }
    return {};
}

} // namespace

auto validate_inputs(std::span<const model::RegionalLoad> loads, std::span<const model::Beam> beams,
                     const CalculationOptions &options) -> std::expected<void, model::DistributionError>
{
    if (loads.empty() && beams.empty())
    {
        return make_error(model::ErrorKind::Configuration, "nothing to distribute: no loads and no beams",
                          {"loads", "beams"});
    }
    const double epsilon = options.tolerance.epsilon;
    if (!std::isfinite(epsilon) || epsilon < 0.0)
    {
        return make_error(model::ErrorKind::Configuration, "tolerance must be finite and >= 0", {"tolerance"});
    }
    for (std::size_t i = 0; i < loads.size(); ++i)
    {
        if (auto status = validate_load(loads[i], i); !status)
        {
            return status;
        }
    }
    for (std::size_t i = 0; i < beams.size(); ++i)
    {
        if (!std::isfinite(beams[i].position))
        {
            return make_error(model::ErrorKind::InvalidBeam,
                              std::format("beam '{}' has a non-finite position", beams[i].name),
                              {"beams", std::format("[{}]", i), "position"});
        }
    }
    return {};
}

auto calculate(std::span<const model::RegionalLoad> loads, std::span<const model::Beam> beams,
               const CalculationOptions &options) -> DistributionOutcome
{
    if (auto status = validate_inputs(loads, beams, options); !status)
    {
        return std::unexpected(std::move(status.error()));
    }
    const auto &tol = options.tolerance;

    auto points = extract_critical_points(loads, beams, tol);
    if (!points)
    {
        return std::unexpected(std::move(points.error()));
    }

    model::DistributionResult result{};
    auto &details             = result.details;
    details.tolerance         = tol;
    details.system_extent     = points->system_extent;
    details.critical_points   = std::move(points->coordinates);
    details.system_boundaries = std::move(points->system_boundaries);
    details.segments          = build_segments(details.critical_points, loads, tol);
    details.zones             = assign_zones(beams, details.system_extent);
    details.loaded_width      = 0.0;
    for (const auto &segment : details.segments)
    {
        details.loaded_width += common::width(segment.span);
    }

    result.beams = distribute(beams, details.zones, details.segments, tol);
    return result;
}

} // namespace trib::distribution
