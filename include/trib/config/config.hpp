/**
 * @file config.hpp
 * @brief YAML-powered scenario loader for tributary load runs that absolutely slaps uwu
 *
 * this header defines the scenario configuration model: regional loads, beams,
 * the shared tolerance, display units, and export targets. it parses YAML 1.2
 * documents into strongly typed C++26 structs, validates them aggressively,
 * and bubbles up ergonomic errors via std::expected. the calculator itself
 * never touches YAML; make_loads()/make_beams() hand it plain model values.
 *
 * @author LukeFrankio
 * @date 2025-11-05
 * @version 1.0
 *
 * @note requires GCC 15.2+ with -std=c++2c (aka C++26) for std::expected
 * @note yaml-cpp 0.8.0+ powers parsing but we stay dependency-light elsewhere
 *
 * example (basic usage):
 * @code
 * using trib::config::load_config_from_file;
 * auto config_result = load_config_from_file("assets/scenarios/edge_beams.yaml");
 * if (!config_result) {
 *     std::println(stderr, "config error: {}", config_result.error().message);
 *     return EXIT_FAILURE;
 * }
 * const auto loads = trib::config::make_loads(*config_result);
 * const auto beams = trib::config::make_beams(*config_result);
 * @endcode
 */
#pragma once

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "trib/common/tolerance.hpp"
#include "trib/model/model.hpp"

namespace YAML
{
class Node;
} // namespace YAML

namespace trib::config
{

/**
 * @brief config error payload with context breadcrumbs for days
 *
 * the loader never throws; it returns std::expected with this error struct.
 * context strings form a breadcrumb trail (e.g., "loads", "[1]", "y_end").
 */
struct ConfigError
{
    std::string              message; ///< spicy human-readable error message uwu
    std::vector<std::string> context; ///< breadcrumb trail showing where things derailed
};

/**
 * @brief one regional load entry with y_start/y_end already resolved
 *
 * YAML may give `width` instead of `y_end`, and may omit `y_start` (it then
 * continues from the previous load's y_end, 0 for the first). the parser
 * resolves both so downstream code only ever sees explicit edges.
 */
struct LoadEntry
{
    std::string name;      ///< unique load name
    double      intensity; ///< force per unit area
    double      y_start;   ///< lower transverse edge
    double      y_end;     ///< upper transverse edge (>= y_start)
    double      length;    ///< extent along the beams (>= 0, default 0)
    std::string color;     ///< display colour (default "blue")
};

/**
 * @brief one beam entry
 */
struct BeamEntry
{
    std::string name;     ///< unique beam name
    double      position; ///< transverse coordinate
    double      length;   ///< span along x (>= 0, default 0)
};

/**
 * @brief unit labels used by the report + SVG writers (purely cosmetic)
 */
struct Units
{
    std::string force{"kN"};
    std::string length{"m"};
};

/**
 * @brief export controls
 */
struct OutputSettings
{
    bool                                 report{true}; ///< print the text report
    std::optional<std::filesystem::path> csv;          ///< contribution CSV target
    std::optional<std::filesystem::path> svg;          ///< layout diagram target
};

/**
 * @brief main configuration object bundling all scenario inputs
 */
struct Config
{
    common::Tolerance      tolerance; ///< shared epsilon (default 1e-9)
    Units                  units;     ///< display units
    std::vector<LoadEntry> loads;     ///< regional loads, file order
    std::vector<BeamEntry> beams;     ///< beams, file order
    OutputSettings         output;    ///< export preferences
};

/**
 * @brief convenience alias for the loader result type (std::expected wrapper)
 */
using ConfigResult = std::expected<Config, ConfigError>;

/**
 * @brief parses YAML config from a file path with aggressive validation
 *
 * ⚠️ IMPURE FUNCTION (has side effects)
 *
 * this helper is impure because:
 * - hits the file system to read YAML
 * - may throw yaml-cpp exceptions internally (captured into expected)
 *
 * @param[in] path filesystem location of YAML document
 * @return ConfigResult containing parsed Config or detailed ConfigError
 *
 * @note validations include: unique non-empty names, finite numbers,
 *       y_end >= y_start, non-negative lengths, exclusive y_end/width, at least
 *       one load or beam, finite non-negative tolerance.
 */
[[nodiscard]] auto load_config_from_file(const std::filesystem::path &path) -> ConfigResult;

/**
 * @brief parses YAML config directly from a string buffer (test-friendly)
 *
 * ⚠️ IMPURE FUNCTION (depends on yaml-cpp's global state when parsing)
 */
[[nodiscard]] auto load_config_from_string(std::string_view yaml_text) -> ConfigResult;

/**
 * @brief low-level parser for already-loaded YAML nodes (advanced usage)
 *
 * ⚠️ IMPURE FUNCTION (depends on yaml-cpp node state)
 */
[[nodiscard]] auto parse_config_node(const YAML::Node &root) -> ConfigResult;

/**
 * @brief converts config load entries into calculator inputs
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto make_loads(const Config &cfg) -> std::vector<model::RegionalLoad>;

/**
 * @brief converts config beam entries into calculator inputs
 *
 * ✨ PURE FUNCTION ✨
 */
[[nodiscard]] auto make_beams(const Config &cfg) -> std::vector<model::Beam>;

} // namespace trib::config
