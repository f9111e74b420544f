/**
 * @file report.hpp
 * @brief plain-text distribution report + coverage diagnostics uwu
 *
 * the calculator stays silent about gaps and overlaps (they are policies, not
 * errors). this module is where they get surfaced: check_coverage() finds
 * uncovered stretches of the loaded region, overlapping load pairs, and the
 * applied-vs-distributed balance, and format_report() renders everything as a
 * human readable block. read-only consumer of DistributionResult, never a
 * producer.
 */
#pragma once

#include <span>
#include <string>
#include <vector>

#include "trib/common/tolerance.hpp"
#include "trib/config/config.hpp"
#include "trib/model/model.hpp"

namespace trib::post
{

/**
 * @brief one load's aggregated share of a beam (all its contributions summed)
 */
struct LoadShare
{
    std::string load_name; ///< load identity
    double      width;     ///< summed tributary width taken from this load
    double      value;     ///< summed distributed load from this load
};

/**
 * @brief pair of loads whose extents overlap (first-match-wins applied)
 */
struct LoadOverlap
{
    std::string      winner; ///< load with the smaller y_start (owns the overlap)
    std::string      loser;  ///< load whose share of the overlap is ignored
    common::Interval span;   ///< overlapping interval
};

/**
 * @brief everything the report flags about how well loads tile the axis
 */
struct CoverageDiagnostics
{
    std::vector<common::Interval> gaps;              ///< uncovered stretches inside the loaded region
    std::vector<LoadOverlap>      overlaps;          ///< overlapping load pairs
    double                        applied_total;     ///< sum(q * width) over all loads
    double                        distributed_total; ///< sum(beam.total)
    bool                          balanced;          ///< applied == distributed within tolerance
    bool                          undistributed;     ///< loads exist but no beam received anything
};

/**
 * @brief aggregates a beam's contributions per load (first-appearance order)
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto summarize_by_load(const model::BeamResult &beam) -> std::vector<LoadShare>;

/**
 * @brief computes gap/overlap/balance diagnostics for a finished pass
 *
 * ✨ PURE FUNCTION ✨
 *
 * @param[in] loads the loads the pass ran with
 * @param[in] result calculator output (its details carry the tolerance)
 * @return diagnostics; balance tolerance scales with sum(|q * width|)
 */
[[nodiscard]] auto check_coverage(std::span<const model::RegionalLoad> loads,
                                  const model::DistributionResult &result) -> CoverageDiagnostics;

/**
 * @brief renders the full text report
 *
 * ✨ PURE FUNCTION ✨ (returns a string, printing is the caller's job)
 *
 * @param[in] loads input loads (listed in the header block)
 * @param[in] result calculator output
 * @param[in] diagnostics output of check_coverage()
 * @param[in] units unit labels for forces and lengths
 * @return multi-line report ending in a newline
 */
[[nodiscard]] auto format_report(std::span<const model::RegionalLoad> loads,
                                 const model::DistributionResult &result,
                                 const CoverageDiagnostics &diagnostics,
                                 const config::Units &units) -> std::string;

} // namespace trib::post
