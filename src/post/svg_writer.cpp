/**
 * @file svg_writer.cpp
 * @brief implementation for the SVG layout diagram
 */
#include "trib/post/svg_writer.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <fstream>
#include <iterator>
#include <string_view>
#include <system_error>

namespace trib::post
{
namespace
{

constexpr std::array<std::string_view, 4> kZonePalette{"#1f3a93", "#8e44ad", "#16a085", "#d35400"};
constexpr double                          kLegendReservePx = 220.0;
constexpr double                          kTitleReservePx  = 30.0;
constexpr double                          kBandOffsetPx    = 20.0;
constexpr double                          kBandWidthPx     = 18.0;
constexpr double                          kPadFraction     = 0.08;

[[nodiscard]] auto make_error(std::string message, std::initializer_list<std::string> ctx = {}) -> SvgError
{
    SvgError err{};
    err.message = std::move(message);
    err.context.assign(ctx.begin(), ctx.end());
    return err;
}

[[nodiscard]] auto escape_xml(std::string_view text) -> std::string
{
    std::string escaped;
    escaped.reserve(text.size());
    for (const char c : text)
    {
        switch (c)
        {
        case '&':
            escaped += "&amp;";
            break;
        case '<':
            escaped += "&lt;";
            break;
        case '>':
            escaped += "&gt;";
            break;
        case '"':
            escaped += "&quot;";
            break;
        default:
            escaped.push_back(c);
            break;
        }
    }
    return escaped;
}

/**
 * @brief world (x along beams, y transverse) -> pixel mapping with y flipped
 */
struct Frame
{
    double x_min;
    double x_max;
    double y_min;
    double y_max;
    double left;
    double top;
    double plot_width;
    double plot_height;

    [[nodiscard]] auto px(double x) const noexcept -> double
    {
        return left + (x - x_min) / (x_max - x_min) * plot_width;
    }

    [[nodiscard]] auto py(double y) const noexcept -> double
    {
        return top + (y_max - y) / (y_max - y_min) * plot_height;
    }
};

[[nodiscard]] auto drawing_length(std::span<const model::RegionalLoad> loads,
                                  const model::DistributionResult &result) -> double
{
    double length = 0.0;
    for (const auto &load : loads)
    {
        length = std::max(length, load.length);
    }
    for (const auto &beam : result.beams)
    {
        length = std::max(length, beam.length);
    }
    if (length <= 0.0)
    {
        length = std::max(common::width(result.details.system_extent), 1.0);
    }
    return length;
}

[[nodiscard]] auto make_frame(double length, const common::Interval &extent, const SvgOptions &options) -> Frame
{
    double y_min = extent.start;
    double y_max = extent.end;
    if (y_max - y_min <= 0.0)
    {
        y_min -= 0.5;
        y_max += 0.5;
    }
    const double pad = (y_max - y_min) * kPadFraction;

    Frame frame{};
    frame.x_min       = 0.0;
    frame.x_max       = length;
    frame.y_min       = y_min - pad;
    frame.y_max       = y_max + pad;
    frame.left        = options.margin;
    frame.top         = options.margin + kTitleReservePx;
    frame.plot_width  = std::max(options.canvas_width - 2.0 * options.margin - kLegendReservePx, 1.0);
    frame.plot_height = std::max(options.canvas_height - 2.0 * options.margin - kTitleReservePx, 1.0);
    return frame;
}

} // namespace

auto render_layout_svg(std::span<const model::RegionalLoad> loads, const model::DistributionResult &result,
                       const SvgOptions &options) -> std::string
{
    const double length  = drawing_length(loads, result);
    const auto   frame   = make_frame(length, result.details.system_extent, options);
    const auto  &len     = options.units.length;
    const auto   line_ld = std::format("{}/{}", options.units.force, options.units.length);

    std::string out;
    auto        sink = std::back_inserter(out);

    std::format_to(sink,
                   "<svg xmlns=\"http://www.w3.org/2000/svg\" width=\"{:.0f}\" height=\"{:.0f}\" "
                   "viewBox=\"0 0 {:.0f} {:.0f}\" font-family=\"sans-serif\" font-size=\"12\">\n",
                   options.canvas_width, options.canvas_height, options.canvas_width, options.canvas_height);
    std::format_to(sink, "  <rect x=\"0\" y=\"0\" width=\"{:.0f}\" height=\"{:.0f}\" fill=\"white\"/>\n",
                   options.canvas_width, options.canvas_height);
    std::format_to(sink, "  <text x=\"{:.3f}\" y=\"{:.3f}\" font-size=\"16\" font-weight=\"bold\">{}</text>\n",
                   options.margin, options.margin, escape_xml(options.title));

    // loads
    std::format_to(sink, "  <g id=\"loads\">\n");
    for (const auto &load : loads)
    {
        const double load_length = load.length > 0.0 ? load.length : length;
        const double x0          = frame.px(0.0);
        const double x1          = frame.px(load_length);
        const double y_top       = frame.py(load.y_end);
        const double y_bottom    = frame.py(load.y_start);
        std::format_to(sink,
                       "    <rect x=\"{:.3f}\" y=\"{:.3f}\" width=\"{:.3f}\" height=\"{:.3f}\" fill=\"{}\" "
                       "fill-opacity=\"0.6\" stroke=\"black\" stroke-width=\"1\"/>\n",
                       x0, y_top, x1 - x0, y_bottom - y_top, escape_xml(load.color));
        std::format_to(sink,
                       "    <text x=\"{:.3f}\" y=\"{:.3f}\" text-anchor=\"middle\" dominant-baseline=\"middle\" "
                       "font-weight=\"bold\">{} ({:.2f} {}, q = {:.3f})</text>\n",
                       0.5 * (x0 + x1), 0.5 * (y_top + y_bottom), escape_xml(load.name), model::width(load), len,
                       load.intensity);
    }
    std::format_to(sink, "  </g>\n");

    // zone boundaries + tributary bands
    const double band_x = frame.px(length) + kBandOffsetPx;
    std::format_to(sink, "  <g id=\"zones\">\n");
    for (std::size_t i = 0; i < result.beams.size(); ++i)
    {
        const auto  &beam   = result.beams[i];
        const double y_top  = frame.py(beam.zone.end);
        const double y_base = frame.py(beam.zone.start);
        std::format_to(sink,
                       "    <rect x=\"{:.3f}\" y=\"{:.3f}\" width=\"{:.3f}\" height=\"{:.3f}\" fill=\"{}\" "
                       "fill-opacity=\"0.5\"/>\n",
                       band_x, y_top, kBandWidthPx, y_base - y_top, kZonePalette[i % kZonePalette.size()]);
        std::format_to(sink, "    <text x=\"{:.3f}\" y=\"{:.3f}\" dominant-baseline=\"middle\" fill=\"{}\">{} zone "
                             "({:.2f} {})</text>\n",
                       band_x + kBandWidthPx + 6.0, 0.5 * (y_top + y_base), kZonePalette[i % kZonePalette.size()],
                       escape_xml(beam.beam_name), common::width(beam.zone), len);
        if (i + 1U < result.beams.size())
        {
            std::format_to(sink,
                           "    <line x1=\"{:.3f}\" y1=\"{:.3f}\" x2=\"{:.3f}\" y2=\"{:.3f}\" stroke=\"blue\" "
                           "stroke-width=\"2\" stroke-dasharray=\"8,4\"/>\n",
                           frame.px(0.0), y_top, band_x + kBandWidthPx, y_top);
        }
    }
    std::format_to(sink, "  </g>\n");

    // beams
    std::format_to(sink, "  <g id=\"beams\">\n");
    for (const auto &beam : result.beams)
    {
        const double beam_length = beam.length > 0.0 ? beam.length : length;
        const double y           = frame.py(beam.position);
        std::format_to(sink,
                       "    <line x1=\"{:.3f}\" y1=\"{:.3f}\" x2=\"{:.3f}\" y2=\"{:.3f}\" stroke=\"#555555\" "
                       "stroke-width=\"5\"/>\n",
                       frame.px(0.0), y, frame.px(beam_length), y);
        std::format_to(sink,
                       "    <text x=\"{:.3f}\" y=\"{:.3f}\">{}: {:.3f} {}</text>\n", frame.px(0.0) + 4.0,
                       y - 6.0, escape_xml(beam.beam_name), beam.total, line_ld);
    }
    std::format_to(sink, "  </g>\n");
    std::format_to(sink, "</svg>\n");
    return out;
}

auto write_layout_svg(const std::filesystem::path &path, std::span<const model::RegionalLoad> loads,
                      const model::DistributionResult &result, const SvgOptions &options)
    -> std::expected<void, SvgError>
{
    if (!path.parent_path().empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            return std::unexpected(make_error("failed to create SVG directory: " + ec.message(), {path.string()}));
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file)
    {
        return std::unexpected(make_error("failed to open SVG file", {path.string()}));
    }
    file << render_layout_svg(loads, result, options);
    if (!file)
    {
        return std::unexpected(make_error("failed to write SVG file", {path.string()}));
    }
    return {};
}

} // namespace trib::post
