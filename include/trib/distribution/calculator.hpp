/**
 * @file calculator.hpp
 * @brief one-call tributary load distribution (the whole pipeline) uwu
 *
 * wires the four stages together, leaf-first:
 * 1. critical point extraction (load edges, beam positions, system extremes)
 * 2. segment building (which load owns each gap)
 * 3. tributary zone assignment (midpoint rule)
 * 4. contribution calculation (zone x segment overlap)
 *
 * data only ever flows forward. the calculator never mutates its inputs and
 * hands back a fresh DistributionResult every time, so calling it twice on the
 * same loads/beams gives bit-identical output. either the full result comes
 * back or a DistributionError does, never anything partial ✨
 *
 * @author LukeFrankio
 * @date 2025-11-05
 * @version 1.0
 *
 * @note requires GCC 15.2+ with -std=c++2c (aka C++26) for std::expected
 *
 * example (basic usage):
 * @code
 * using namespace trib;
 * const auto outcome = distribution::calculate(loads, beams);
 * if (!outcome) {
 *     std::println(stderr, "{}: {}", model::to_string(outcome.error().kind), outcome.error().message);
 *     return EXIT_FAILURE;
 * }
 * for (const auto& beam : outcome->beams) {
 *     std::println("{} carries {:.3f} kN/m", beam.beam_name, beam.total);
 * }
 * @endcode
 */
#pragma once

#include <expected>
#include <span>

#include "trib/common/tolerance.hpp"
#include "trib/model/model.hpp"

namespace trib::distribution
{

/**
 * @brief knobs for a calculation pass
 */
struct CalculationOptions
{
    common::Tolerance tolerance{}; ///< shared epsilon for every stage
};

/**
 * @brief calculator result alias (std::expected wrapper)
 */
using DistributionOutcome = std::expected<model::DistributionResult, model::DistributionError>;

/**
 * @brief checks inputs before any stage runs
 *
 * ✨ PURE FUNCTION ✨
 *
 * rejects: both lists empty (Configuration), negative or non-finite tolerance
 * (Configuration), non-finite load numbers or y_end < y_start (InvalidLoad),
 * non-finite beam positions (InvalidBeam).
 *
 * @return empty expected on success, first failure otherwise
 */
[[nodiscard]] auto validate_inputs(std::span<const model::RegionalLoad> loads,
                                   std::span<const model::Beam> beams,
                                   const CalculationOptions &options)
    -> std::expected<void, model::DistributionError>;

/**
 * @brief runs the full tributary distribution pipeline
 *
 * ✨ PURE FUNCTION ✨
 *
 * this function is pure because:
 * - inputs are read-only spans, the result is freshly allocated
 * - no I/O, no globals, no hidden caches
 * - deterministic: coordinates and beams are totally ordered before use
 *
 * @param[in] loads regional loads (may be empty when beams are present)
 * @param[in] beams beams (may be empty when loads are present; the result then
 *                  has no beams and all load goes undistributed)
 * @param[in] options tolerance knob
 * @return DistributionResult (beams ascending by position) or DistributionError
 *
 * @post sum(beam.total) == sum(q * width) when loads tile the region without
 *       gaps or overlaps and at least one beam exists
 */
[[nodiscard]] auto calculate(std::span<const model::RegionalLoad> loads,
                             std::span<const model::Beam> beams,
                             const CalculationOptions &options = {}) -> DistributionOutcome;

} // namespace trib::distribution
