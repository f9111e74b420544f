/**
 * @file cli.hpp
 * @brief argument parsing + demo scenario for the trib_distribute driver
 */
#pragma once

#include <expected>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "trib/config/config.hpp"

namespace trib::app
{

struct CliArgs
{
    std::filesystem::path scenario{};
    std::filesystem::path output_dir{};
    bool                  show_help{false};
};

struct CliError
{
    std::string message;
};

/**
 * @brief parses the driver's arguments (program name already stripped)
 *
 * ✨ PURE FUNCTION ✨
 *
 * accepts `-h/--help`, `-o/--output-dir DIR` and at most one scenario path.
 * `--output-dir` without a scenario is rejected: the built-in demo has no
 * exports to place.
 */
[[nodiscard]] auto parse_args(std::span<const std::string_view> args) -> std::expected<CliArgs, CliError>;

/**
 * @brief renders a breadcrumb trail as `loads[1].y_end`
 */
[[nodiscard]] auto join_context(const std::vector<std::string> &context) -> std::string;

/**
 * @brief two adjacent loads with beams on the outer edges (split at y = 0.5)
 */
[[nodiscard]] auto make_demo_config() -> config::Config;

} // namespace trib::app
