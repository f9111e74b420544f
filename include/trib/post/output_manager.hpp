/**
 * @file output_manager.hpp
 * @brief high-level orchestrator for scenario exports (CSV + SVG) uwu
 */
#pragma once

#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include "trib/config/config.hpp"
#include "trib/model/model.hpp"

namespace trib::post
{

struct OutputError
{
    std::string              message;
    std::vector<std::string> context;
};

/**
 * @brief writes whichever exports the scenario's output settings ask for
 *
 * relative export paths resolve against the root directory handed to the
 * constructor; absolute ones are used as-is.
 */
class OutputManager
{
public:
    OutputManager(std::filesystem::path root, config::OutputSettings settings, config::Units units);

    /**
     * @brief exports one finished pass
     *
     * @return paths actually written (CSV first, then SVG) or the first failure
     */
    [[nodiscard]] auto handle_result(std::span<const model::RegionalLoad> loads,
                                     const model::DistributionResult &result)
        -> std::expected<std::vector<std::filesystem::path>, OutputError>;

private:
    [[nodiscard]] auto resolve(const std::filesystem::path &target) const -> std::filesystem::path;

    std::filesystem::path  root_{};
    config::OutputSettings settings_{};
    config::Units          units_{};
};

} // namespace trib::post
