/**
 * @file cli.cpp
 * @brief trib_distribute argument handling
 */
#include "trib/app/cli.hpp"

namespace trib::app
{

auto parse_args(std::span<const std::string_view> args) -> std::expected<CliArgs, CliError>
{
    CliArgs parsed{};
    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string_view arg = args[i];
        if (arg == "-h" || arg == "--help")
        {
            parsed.show_help = true;
        }
        else if (arg == "--output-dir" || arg == "-o")
        {
            if (i + 1U >= args.size())
            {
                return std::unexpected(CliError{"--output-dir needs a directory argument"});
            }
            parsed.output_dir = args[++i];
        }
        else if (arg.starts_with('-'))
        {
            return std::unexpected(CliError{std::string{"unknown option "} + std::string{arg}});
        }
        else if (parsed.scenario.empty())
        {
            parsed.scenario = arg;
        }
        else
        {
            return std::unexpected(CliError{"only one scenario file may be given"});
        }
    }
    if (!parsed.show_help && parsed.scenario.empty() && !parsed.output_dir.empty())
    {
        return std::unexpected(CliError{"--output-dir needs a scenario file, the built-in demo writes no exports"});
    }
    return parsed;
}

auto join_context(const std::vector<std::string> &context) -> std::string
{
    std::string joined;
    for (const auto &crumb : context)
    {
        if (!joined.empty() && !crumb.starts_with('['))
        {
            joined += '.';
        }
        joined += crumb;
    }
    return joined;
}

auto make_demo_config() -> config::Config
{
    config::Config cfg{};
    cfg.loads = {
        config::LoadEntry{.name      = "F_0_L",
                          .intensity = -0.72,
                          .y_start   = 0.0,
                          .y_end     = 0.2,
                          .length    = 2.5,
                          .color     = "red"},
        config::LoadEntry{.name      = "G_0_L",
                          .intensity = -0.72,
                          .y_start   = 0.2,
                          .y_end     = 1.0,
                          .length    = 2.5,
                          .color     = "green"},
    };
    cfg.beams = {
        config::BeamEntry{.name = "P_L0_S0", .position = 0.0, .length = 2.5},
        config::BeamEntry{.name = "P_L1_S0", .position = 1.0, .length = 2.5},
    };
    return cfg;
}

} // namespace trib::app
