/**
 * @file distribute_main.cpp
 * @brief command-line driver: YAML scenario in, tributary report + exports out uwu
 *
 * usage:
 *   trib_distribute                              # built-in two-load / two-beam demo, report only
 *   trib_distribute scenario.yaml                # report to stdout, exports next to cwd
 *   trib_distribute scenario.yaml --output-dir out
 *
 * this executable is thin glue: config::load_config_from_file ->
 * distribution::calculate -> post::format_report + post::OutputManager. every
 * failure gets printed to stderr with its breadcrumbs and exits with 1.
 */

#include <cstdlib>
#include <filesystem>
#include <print>
#include <string>
#include <string_view>
#include <vector>

#include "trib/app/cli.hpp"
#include "trib/config/config.hpp"
#include "trib/distribution/calculator.hpp"
#include "trib/model/model.hpp"
#include "trib/post/output_manager.hpp"
#include "trib/post/report.hpp"

namespace
{

void print_usage()
{
    std::println("usage: trib_distribute [scenario.yaml] [--output-dir DIR]");
    std::println("  without a scenario the built-in two-load demo runs (report only, no --output-dir)");
}

} // namespace

int main(int argc, char **argv)
{
    const std::vector<std::string_view> tokens(argv + 1, argv + argc);
    const auto                          args = trib::app::parse_args(tokens);
    if (!args)
    {
        std::println(stderr, "[trib::cli] {}", args.error().message);
        print_usage();
        return EXIT_FAILURE;
    }
    if (args->show_help)
    {
        print_usage();
        return EXIT_SUCCESS;
    }

    trib::config::Config cfg{};
    if (args->scenario.empty())
    {
        std::println("[trib::cli] no scenario given, running built-in demo");
        cfg = trib::app::make_demo_config();
    }
    else
    {
        auto loaded = trib::config::load_config_from_file(args->scenario);
        if (!loaded)
        {
            std::println(stderr, "[trib::cli] config error: {} (at {})", loaded.error().message,
                         trib::app::join_context(loaded.error().context));
            return EXIT_FAILURE;
        }
        cfg = std::move(*loaded);
    }

    const auto loads = trib::config::make_loads(cfg);
    const auto beams = trib::config::make_beams(cfg);

    const auto outcome = trib::distribution::calculate(loads, beams, {.tolerance = cfg.tolerance});
    if (!outcome)
    {
        std::println(stderr, "[trib::cli] {}: {} (at {})", trib::model::to_string(outcome.error().kind),
                     outcome.error().message, trib::app::join_context(outcome.error().context));
        return EXIT_FAILURE;
    }

    if (cfg.output.report)
    {
        const auto diagnostics = trib::post::check_coverage(loads, *outcome);
        std::print("{}", trib::post::format_report(loads, *outcome, diagnostics, cfg.units));
    }

    trib::post::OutputManager outputs{args->output_dir, cfg.output, cfg.units};
    const auto                written = outputs.handle_result(loads, *outcome);
    if (!written)
    {
        std::println(stderr, "[trib::cli] export error: {} (at {})", written.error().message,
                     trib::app::join_context(written.error().context));
        return EXIT_FAILURE;
    }
    for (const auto &path : *written)
    {
        std::println("[trib::cli] wrote {}", path.string());
    }

    return EXIT_SUCCESS;
}
