/**
 * @file csv_writer.hpp
 * @brief CSV export of itemized beam contributions uwu
 */
#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <vector>

#include "trib/model/model.hpp"

namespace trib::post
{

struct CsvError
{
    std::string              message;
    std::vector<std::string> context;
};

/**
 * @brief serializes contributions to CSV text (one row per contribution + a TOTAL row per beam)
 *
 * ✨ PURE FUNCTION ✨
 *
 * columns: beam,position,zone_lower,zone_upper,load,start,end,width,value.
 * TOTAL rows leave load/start/end empty and put summed width + total.
 */
[[nodiscard]] auto format_contributions_csv(const model::DistributionResult &result) -> std::string;

/**
 * @brief writes format_contributions_csv() output to disk
 *
 * ⚠️ IMPURE FUNCTION ⚠️ (filesystem; parent directories auto-created)
 */
[[nodiscard]] auto write_contributions_csv(const std::filesystem::path &path,
                                           const model::DistributionResult &result)
    -> std::expected<void, CsvError>;

} // namespace trib::post
