/**
 * @file model.hpp
 * @brief data model for regional loads, beams, and their tributary results uwu
 *
 * inputs (RegionalLoad, Beam) are immutable value types handed to the
 * calculator. outputs come back as fresh records: one BeamResult per beam plus
 * a strongly typed CalculationDetails bundle carrying every intermediate the
 * pipeline produced (critical points, boundaries, segments, zones). nothing in
 * here ever gets mutated by a calculation pass, so reruns can't alias old
 * results ✨
 *
 * coordinate convention: y is the transverse axis (perpendicular to the
 * beams), x runs along the beams. only y matters for the math; lengths and
 * colours ride along for the report + SVG writers.
 *
 * @author LukeFrankio
 * @date 2025-11-05
 * @version 1.0
 *
 * @note expects GCC 15.2+ and C++26
 *
 * example (basic usage):
 * @code
 * using namespace trib::model;
 * std::vector<RegionalLoad> loads{
 *     RegionalLoad{.name = "F", .intensity = -0.72, .y_start = 0.0, .y_end = 0.2},
 *     RegionalLoad{.name = "G", .intensity = -0.72, .y_start = 0.2, .y_end = 1.0},
 * };
 * std::vector<Beam> beams{Beam{.name = "B0", .position = 0.0}, Beam{.name = "B1", .position = 1.0}};
 * // feed both into trib::distribution::calculate and read BeamResult totals uwu
 * @endcode
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "trib/common/tolerance.hpp"

namespace trib::model
{

/**
 * @brief area load with an extent along the transverse axis
 */
struct RegionalLoad
{
    std::string name;            ///< identity, shows up in every contribution
    double      intensity{0.0};  ///< force per unit area [kN/m^2 by convention]
    double      y_start{0.0};    ///< lower transverse edge [m]
    double      y_end{0.0};      ///< upper transverse edge [m], must be >= y_start
    double      length{0.0};     ///< extent along the beams [m], rendering only
    std::string color{"blue"};   ///< display colour, rendering only
};

/**
 * @brief transverse extent of a load as an interval
 */
[[nodiscard]] constexpr auto extent(const RegionalLoad &load) noexcept -> common::Interval
{
    return common::Interval{load.y_start, load.y_end};
}

/**
 * @brief load width (y_end - y_start)
 */
[[nodiscard]] constexpr auto width(const RegionalLoad &load) noexcept -> double
{
    return load.y_end - load.y_start;
}

/**
 * @brief linear support sitting at a fixed transverse position
 */
struct Beam
{
    std::string name;           ///< identity ("P_L0_S0", ...)
    double      position{0.0};  ///< transverse coordinate [m]
    double      length{0.0};    ///< span along x [m], rendering only
};

/**
 * @brief axis piece between two consecutive critical points with one owning load
 */
struct Segment
{
    common::Interval span;           ///< [y_start, y_end)
    double           intensity{0.0}; ///< intensity of the covering load
    std::string      load_name;      ///< covering load identity
    std::size_t      load_index{0U}; ///< index into the caller's load list
};

/**
 * @brief half-distance-to-neighbour interval a beam is responsible for
 */
struct TributaryZone
{
    std::size_t      beam_index{0U}; ///< index into the caller's beam list
    common::Interval bounds;         ///< [lower, upper]
};

/**
 * @brief one itemized slice of load landing on a beam
 */
struct Contribution
{
    std::string load_name;    ///< which load this slice came from
    double      start{0.0};   ///< overlap lower edge
    double      end{0.0};     ///< overlap upper edge
    double      width{0.0};   ///< end - start (effective tributary width)
    double      value{0.0};   ///< intensity * width [force per unit length]
};

/**
 * @brief per-beam output record, ordered contributions + their sum
 */
struct BeamResult
{
    std::string               beam_name;     ///< copied from Beam::name
    double                    position{0.0}; ///< copied from Beam::position
    double                    length{0.0};   ///< copied from Beam::length
    std::size_t               beam_index{0U}; ///< index into the caller's beam list
    common::Interval          zone;          ///< tributary interval
    std::vector<Contribution> contributions; ///< ascending by start coordinate
    double                    total{0.0};    ///< sum of contribution values
};

/**
 * @brief every intermediate the pipeline produced, strongly typed
 */
struct CalculationDetails
{
    std::vector<double>        critical_points;   ///< sorted, eps-deduplicated
    std::vector<double>        system_boundaries; ///< sorted beam positions + load extremes
    common::Interval           system_extent;     ///< [min boundary, max boundary]
    std::vector<Segment>       segments;          ///< covered pieces only, ascending
    std::vector<TributaryZone> zones;             ///< ascending beam-position order
    double                     loaded_width{0.0}; ///< summed width of all segments
    common::Tolerance          tolerance;         ///< epsilon the pass ran with
};

/**
 * @brief full output of one calculation pass
 */
struct DistributionResult
{
    std::vector<BeamResult> beams;   ///< ascending beam-position order
    CalculationDetails      details; ///< intermediates for reporting/plotting
};

/**
 * @brief failure categories surfaced by the calculator
 */
enum class ErrorKind : std::uint8_t
{
    Configuration = 0U, ///< inputs structurally insufficient (no loads and no beams, bad tolerance)
    InvalidLoad   = 1U, ///< negative width or non-finite numbers on a load
    InvalidBeam   = 2U  ///< non-finite beam position
};

/**
 * @brief calculator error payload with spicy breadcrumbs
 */
struct DistributionError
{
    ErrorKind                kind;    ///< taxonomy bucket
    std::string              message; ///< human readable reason
    std::vector<std::string> context; ///< breadcrumbs (e.g., "loads", "[1]", "y_end")
};

/**
 * @brief short label for an ErrorKind ("ConfigurationError", ...)
 */
[[nodiscard]] auto to_string(ErrorKind kind) -> std::string;

} // namespace trib::model
