/**
 * @file config.cpp
 * @brief implementation of the YAML scenario loader with bougie validation uwu
 *
 * this translation unit backs config.hpp with the full YAML parsing pipeline.
 * it leans on yaml-cpp 0.8.0+, wraps everything in std::expected, and emits
 * error breadcrumbs so humans can fix typos without doom scrolling logs.
 */
#include "trib/config/config.hpp"

#include <cmath>
#include <format>
#include <unordered_set>
#include <yaml-cpp/yaml.h>

namespace trib::config
{
namespace
{

[[nodiscard]] auto make_error(std::string message, std::vector<std::string> ctx) -> ConfigResult
{
    return std::unexpected(ConfigError{std::move(message), std::move(ctx)});
}

template <typename T>
[[nodiscard]] auto fail(std::string message, std::vector<std::string> ctx) -> std::expected<T, ConfigError>
{
    return std::unexpected(ConfigError{std::move(message), std::move(ctx)});
}

[[nodiscard]] auto with_key(std::vector<std::string> ctx, const std::string &key) -> std::vector<std::string>
{
    ctx.push_back(key);
    return ctx;
}

[[nodiscard]] auto read_optional_double(const YAML::Node &parent, const std::string &key,
                                        const std::vector<std::string> &ctx)
    -> std::expected<std::optional<double>, ConfigError>
{
    const auto node = parent[key];
    if (!node || node.IsNull())
    {
        return std::optional<double>{};
    }
    if (!node.IsScalar())
    {
        return fail<std::optional<double>>(std::format("{} must be a scalar number", key), with_key(ctx, key));
    }
    double value{};
    try
    {
        value = node.as<double>();
    }
    catch (const YAML::Exception &ex)
    {
        return fail<std::optional<double>>(ex.what(), with_key(ctx, key));
    }
    if (!std::isfinite(value))
    {
        return fail<std::optional<double>>(std::format("{} must be finite", key), with_key(ctx, key));
    }
    return std::optional<double>{value};
}

[[nodiscard]] auto read_required_double(const YAML::Node &parent, const std::string &key,
                                        const std::vector<std::string> &ctx) -> std::expected<double, ConfigError>
{
    auto value = read_optional_double(parent, key, ctx);
    if (!value)
    {
        return std::unexpected(std::move(value.error()));
    }
    if (!value->has_value())
    {
        return fail<double>(std::format("missing required number '{}'", key), with_key(ctx, key));
    }
    return **value;
}

[[nodiscard]] auto read_optional_string(const YAML::Node &parent, const std::string &key,
                                        const std::vector<std::string> &ctx)
    -> std::expected<std::optional<std::string>, ConfigError>
{
    const auto node = parent[key];
    if (!node || node.IsNull())
    {
        return std::optional<std::string>{};
    }
    if (!node.IsScalar())
    {
        return fail<std::optional<std::string>>(std::format("{} must be a scalar string", key),
                                                with_key(ctx, key));
    }
    return std::optional<std::string>{node.as<std::string>()};
}

[[nodiscard]] auto read_name(const YAML::Node &entry, const std::vector<std::string> &ctx,
                             std::unordered_set<std::string> &seen, std::string_view owner)
    -> std::expected<std::string, ConfigError>
{
    auto name = read_optional_string(entry, "name", ctx);
    if (!name)
    {
        return std::unexpected(std::move(name.error()));
    }
    if (!name->has_value() || name->value().empty())
    {
        return fail<std::string>(std::format("{}.name must be a non-empty string", owner), with_key(ctx, "name"));
    }
    if (!seen.insert(name->value()).second)
    {
        return fail<std::string>(std::format("{} names must be unique", owner), with_key(ctx, "name"));
    }
    return std::move(name->value());
}

[[nodiscard]] auto read_length(const YAML::Node &entry, const std::vector<std::string> &ctx,
                               std::string_view owner) -> std::expected<double, ConfigError>
{
    auto length = read_optional_double(entry, "length", ctx);
    if (!length)
    {
        return std::unexpected(std::move(length.error()));
    }
    const double value = length->value_or(0.0);
    if (value < 0.0)
    {
        return fail<double>(std::format("{}.length must be >= 0", owner), with_key(ctx, "length"));
    }
    return value;
}

[[nodiscard]] auto parse_load(const YAML::Node &entry, std::vector<std::string> ctx, double previous_end,
                              std::unordered_set<std::string> &seen) -> std::expected<LoadEntry, ConfigError>
{
    if (!entry.IsMap())
    {
        return fail<LoadEntry>("load entry must be a map", std::move(ctx));
    }
    LoadEntry load{};

    auto name = read_name(entry, ctx, seen, "load");
    if (!name)
    {
        return std::unexpected(std::move(name.error()));
    }
    load.name = std::move(*name);

    auto intensity = read_required_double(entry, "intensity", ctx);
    if (!intensity)
    {
        return std::unexpected(std::move(intensity.error()));
    }
    load.intensity = *intensity;

    auto y_start = read_optional_double(entry, "y_start", ctx);
    auto y_end   = read_optional_double(entry, "y_end", ctx);
    auto width   = read_optional_double(entry, "width", ctx);
    if (!y_start)
    {
        return std::unexpected(std::move(y_start.error()));
    }
    if (!y_end)
    {
        return std::unexpected(std::move(y_end.error()));
    }
    if (!width)
    {
        return std::unexpected(std::move(width.error()));
    }
    if (y_end->has_value() && width->has_value())
    {
        return fail<LoadEntry>("load must give either y_end or width, not both", with_key(ctx, "width"));
    }
    if (!y_end->has_value() && !width->has_value())
    {
        return fail<LoadEntry>("load needs y_end or width", with_key(ctx, "y_end"));
    }
    if (width->has_value() && width->value() < 0.0)
    {
        return fail<LoadEntry>("load.width must be >= 0", with_key(ctx, "width"));
    }

    load.y_start = y_start->value_or(previous_end);
    load.y_end   = y_end->has_value() ? y_end->value() : load.y_start + width->value();
    if (load.y_end < load.y_start)
    {
        return fail<LoadEntry>("load.y_end must be >= load.y_start", with_key(ctx, "y_end"));
    }

    auto length = read_length(entry, ctx, "load");
    if (!length)
    {
        return std::unexpected(std::move(length.error()));
    }
    load.length = *length;

    auto color = read_optional_string(entry, "color", ctx);
    if (!color)
    {
        return std::unexpected(std::move(color.error()));
    }
    load.color = color->value_or("blue");
    return load;
}

[[nodiscard]] auto parse_beam(const YAML::Node &entry, std::vector<std::string> ctx,
                              std::unordered_set<std::string> &seen) -> std::expected<BeamEntry, ConfigError>
{
    if (!entry.IsMap())
    {
        return fail<BeamEntry>("beam entry must be a map", std::move(ctx));
    }
    BeamEntry beam{};

    auto name = read_name(entry, ctx, seen, "beam");
    if (!name)
    {
        return std::unexpected(std::move(name.error()));
    }
    beam.name = std::move(*name);

    auto position = read_required_double(entry, "position", ctx);
    if (!position)
    {
        return std::unexpected(std::move(position.error()));
    }
    beam.position = *position;

    auto length = read_length(entry, ctx, "beam");
    if (!length)
    {
        return std::unexpected(std::move(length.error()));
    }
    beam.length = *length;
    return beam;
}

[[nodiscard]] auto is_sequence_or_absent(const YAML::Node &node) -> bool
{
    return !node || node.IsNull() || node.IsSequence();
}

} // namespace

auto load_config_from_file(const std::filesystem::path &path) -> ConfigResult
{
    try
    {
        const auto node = YAML::LoadFile(path.string());
        return parse_config_node(node);
    }
    catch (const YAML::BadFile &ex)
    {
        return make_error(std::format("unable to open config file: {}", ex.what()), {path.string()});
    }
    catch (const YAML::Exception &ex)
    {
        return make_error(std::format("YAML parse error: {}", ex.what()), {path.string()});
    }
}

auto load_config_from_string(std::string_view yaml_text) -> ConfigResult
{
    try
    {
        const auto node = YAML::Load(std::string{yaml_text});
        return parse_config_node(node);
    }
    catch (const YAML::Exception &ex)
    {
        return make_error(std::format("YAML parse error: {}", ex.what()), {});
    }
}

auto parse_config_node(const YAML::Node &root) -> ConfigResult
{
    if (!root || !root.IsMap())
    {
        return make_error("config root must be a mapping", {});
    }

    Config cfg{};

    // tolerance
    {
        auto tolerance = read_optional_double(root, "tolerance", {});
        if (!tolerance)
        {
            return std::unexpected(std::move(tolerance.error()));
        }
        cfg.tolerance.epsilon = tolerance->value_or(common::kDefaultEpsilon);
        if (cfg.tolerance.epsilon < 0.0)
        {
            return make_error("tolerance must be >= 0", {"tolerance"});
        }
    }

    // units (optional map)
    const auto units_node = root["units"];
    if (units_node && !units_node.IsNull())
    {
        if (!units_node.IsMap())
        {
            return make_error("units must be a map", {"units"});
        }
        auto force  = read_optional_string(units_node, "force", {"units"});
        auto length = read_optional_string(units_node, "length", {"units"});
        if (!force)
        {
            return std::unexpected(std::move(force.error()));
        }
        if (!length)
        {
            return std::unexpected(std::move(length.error()));
        }
        cfg.units.force  = force->value_or(cfg.units.force);
        cfg.units.length = length->value_or(cfg.units.length);
    }

    // loads
    const auto loads_node = root["loads"];
    if (!is_sequence_or_absent(loads_node))
    {
        return make_error("loads must be a sequence", {"loads"});
    }
    if (loads_node && loads_node.IsSequence())
    {
        cfg.loads.reserve(loads_node.size());
        std::unordered_set<std::string> seen;
        double                          previous_end = 0.0;
        for (std::size_t i = 0; i < loads_node.size(); ++i)
        {
            auto load = parse_load(loads_node[i], {"loads", std::format("[{}]", i)}, previous_end, seen);
            if (!load)
            {
                return std::unexpected(std::move(load.error()));
            }
            previous_end = load->y_end;
            cfg.loads.push_back(std::move(*load));
        }
    }

    // beams
    const auto beams_node = root["beams"];
    if (!is_sequence_or_absent(beams_node))
    {
        return make_error("beams must be a sequence", {"beams"});
    }
    if (beams_node && beams_node.IsSequence())
    {
        cfg.beams.reserve(beams_node.size());
        std::unordered_set<std::string> seen;
        for (std::size_t i = 0; i < beams_node.size(); ++i)
        {
            auto beam = parse_beam(beams_node[i], {"beams", std::format("[{}]", i)}, seen);
            if (!beam)
            {
                return std::unexpected(std::move(beam.error()));
            }
            cfg.beams.push_back(std::move(*beam));
        }
    }

    if (cfg.loads.empty() && cfg.beams.empty())
    {
        return make_error("scenario needs at least one load or beam", {"loads", "beams"});
    }

    // output (optional map)
    const auto output_node = root["output"];
    if (output_node && !output_node.IsNull())
    {
        if (!output_node.IsMap())
        {
            return make_error("output must be a map", {"output"});
        }
        const auto report_node = output_node["report"];
        if (report_node && !report_node.IsNull())
        {
            try
            {
                cfg.output.report = report_node.as<bool>();
            }
            catch (const YAML::Exception &ex)
            {
                return make_error(ex.what(), {"output", "report"});
            }
        }
        auto csv = read_optional_string(output_node, "csv", {"output"});
        auto svg = read_optional_string(output_node, "svg", {"output"});
        if (!csv)
        {
            return std::unexpected(std::move(csv.error()));
        }
        if (!svg)
        {
            return std::unexpected(std::move(svg.error()));
        }
        if (csv->has_value())
        {
            cfg.output.csv = std::filesystem::path{csv->value()};
        }
        if (svg->has_value())
        {
            cfg.output.svg = std::filesystem::path{svg->value()};
        }
    }

    return cfg;
}

auto make_loads(const Config &cfg) -> std::vector<model::RegionalLoad>
{
    std::vector<model::RegionalLoad> loads;
    loads.reserve(cfg.loads.size());
    for (const auto &entry : cfg.loads)
    {
        loads.push_back(model::RegionalLoad{.name      = entry.name,
                                            .intensity = entry.intensity,
                                            .y_start   = entry.y_start,
                                            .y_end     = entry.y_end,
                                            .length    = entry.length,
                                            .color     = entry.color});
    }
    return loads;
}

auto make_beams(const Config &cfg) -> std::vector<model::Beam>
{
    std::vector<model::Beam> beams;
    beams.reserve(cfg.beams.size());
    for (const auto &entry : cfg.beams)
    {
        beams.push_back(model::Beam{.name = entry.name, .position = entry.position, .length = entry.length});
    }
    return beams;
}

} // namespace trib::config
