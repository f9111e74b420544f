/**
 * @file svg_writer.hpp
 * @brief plan-view SVG diagram of loads, beams, and tributary zones uwu
 *
 * draws the same picture a structural engineer sketches by hand: load
 * rectangles (length along x, width along y) in their colours, beams as thick
 * lines at their positions, dashed zone boundaries at the midpoints, coloured
 * tributary bands along the right edge labelled with their widths, and each
 * beam's total next to it. y grows upward like the engineering axis, not
 * downward like SVG pixels.
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

/**
 * @brief contextual error payload for SVG export mishaps
 */
struct SvgError
{
    std::string              message; ///< spicy human-readable reason
    std::vector<std::string> context; ///< breadcrumbs (path, stage, etc.)
};

/**
 * @brief canvas + labelling knobs
 */
struct SvgOptions
{
    double        canvas_width{960.0};  ///< total image width [px]
    double        canvas_height{600.0}; ///< total image height [px]
    double        margin{60.0};         ///< blank border [px]
    std::string   title{"Regional load distribution onto beams"};
    config::Units units{};              ///< unit labels in annotations
};

/**
 * @brief renders the layout diagram as an SVG document string
 *
 * ✨ PURE FUNCTION ✨ (deterministic text, fixed 3-decimal coordinates)
 */
[[nodiscard]] auto render_layout_svg(std::span<const model::RegionalLoad> loads,
                                     const model::DistributionResult &result,
                                     const SvgOptions &options = {}) -> std::string;

/**
 * @brief writes render_layout_svg() output to disk
 *
 * ⚠️ IMPURE FUNCTION ⚠️ (filesystem; parent directories auto-created)
 */
[[nodiscard]] auto write_layout_svg(const std::filesystem::path &path,
                                    std::span<const model::RegionalLoad> loads,
                                    const model::DistributionResult &result,
                                    const SvgOptions &options = {}) -> std::expected<void, SvgError>;

} // namespace trib::post
