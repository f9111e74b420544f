/**
 * @file config_validation_test.cpp
 * @brief exhaustive scenario loader validation because parsing bugs are cringe uwu
 */
#include <filesystem>
#include <functional>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "support/scenario_builder.hpp"
#include "test_config.hpp"
#include "trib/config/config.hpp"
#include "trib/distribution/calculator.hpp"

using testing::ElementsAre;
using testing::ElementsAreArray;
using testing::HasSubstr;

namespace
{

[[nodiscard]] auto test_data_path(std::string_view file) -> std::filesystem::path
{
    return std::filesystem::path{TRIB_TEST_DATA_DIR} / file;
}

[[nodiscard]] auto make_good_config() -> trib::config::Config
{
    const auto result = trib::test_support::load_scenario();
    if (!result)
    {
        throw std::runtime_error("expected default builder to succeed");
    }
    return result.value();
}

void replace_first(std::string &yaml, std::string_view token, std::string_view replacement)
{
    const auto pos = yaml.find(token);
    if (pos != std::string::npos)
    {
        yaml.replace(pos, token.size(), replacement);
    }
}

} // namespace

TEST(ConfigValidation, ParsesGoldenScenarioFromBuilder)
{
    const auto config = make_good_config();
    EXPECT_DOUBLE_EQ(config.tolerance.epsilon, trib::common::kDefaultEpsilon);
    EXPECT_EQ(config.units.force, "kN");
    EXPECT_EQ(config.units.length, "m");
    ASSERT_EQ(config.loads.size(), 2U);
    EXPECT_EQ(config.loads.front().name, "F");
    EXPECT_DOUBLE_EQ(config.loads.front().intensity, -0.72);
    EXPECT_DOUBLE_EQ(config.loads.back().y_start, 0.2);
    EXPECT_DOUBLE_EQ(config.loads.back().y_end, 1.0);
    EXPECT_DOUBLE_EQ(config.loads.back().length, 2.5);
    EXPECT_EQ(config.loads.back().color, "blue");
    ASSERT_EQ(config.beams.size(), 2U);
    EXPECT_EQ(config.beams.back().name, "P1");
    EXPECT_DOUBLE_EQ(config.beams.back().position, 1.0);
    EXPECT_DOUBLE_EQ(config.beams.back().length, 0.0);
    EXPECT_TRUE(config.output.report);
    EXPECT_FALSE(config.output.csv.has_value());
    EXPECT_FALSE(config.output.svg.has_value());
}

TEST(ConfigValidation, LoadsScenarioFromFixtureOnDisk)
{
    const auto result = trib::config::load_config_from_file(test_data_path("edge_beams.yaml"));
    ASSERT_TRUE(result.has_value()) << result.error().message;
    ASSERT_EQ(result->loads.size(), 2U);
    EXPECT_DOUBLE_EQ(result->loads[0].y_start, 0.0);
    EXPECT_DOUBLE_EQ(result->loads[0].y_end, 0.2);
    EXPECT_DOUBLE_EQ(result->loads[1].y_start, 0.2);
    EXPECT_DOUBLE_EQ(result->loads[1].y_end, 1.0);
    EXPECT_EQ(result->loads[0].color, "red");
    EXPECT_EQ(result->loads[1].color, "green");
    ASSERT_EQ(result->beams.size(), 2U);
    EXPECT_EQ(result->beams[0].name, "P_L0_S0");
    EXPECT_DOUBLE_EQ(result->beams[1].length, 2.5);
}

TEST(ConfigValidation, FixtureFeedsTheCalculator)
{
    const auto config = trib::config::load_config_from_file(test_data_path("interior_beams.yaml"));
    ASSERT_TRUE(config.has_value()) << config.error().message;

    const auto loads   = trib::config::make_loads(*config);
    const auto beams   = trib::config::make_beams(*config);
    const auto outcome = trib::distribution::calculate(loads, beams, {.tolerance = config->tolerance});
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    ASSERT_EQ(outcome->beams.size(), 2U);
    EXPECT_NEAR(outcome->beams[0].total, -0.936, 1.0e-9);
    EXPECT_NEAR(outcome->beams[1].total, -0.504, 1.0e-9);
}

TEST(ConfigValidation, EdgeBeamFixtureSplitsAtTheMidpoint)
{
    const auto config = trib::config::load_config_from_file(test_data_path("edge_beams.yaml"));
    ASSERT_TRUE(config.has_value()) << config.error().message;

    const auto loads   = trib::config::make_loads(*config);
    const auto beams   = trib::config::make_beams(*config);
    const auto outcome = trib::distribution::calculate(loads, beams, {.tolerance = config->tolerance});
    ASSERT_TRUE(outcome.has_value()) << outcome.error().message;
    ASSERT_EQ(outcome->beams.size(), 2U);
    EXPECT_NEAR(outcome->beams[0].zone.end, 0.5, 1.0e-9);
    EXPECT_NEAR(outcome->beams[0].total, -0.36, 1.0e-9);
    EXPECT_NEAR(outcome->beams[1].total, -0.36, 1.0e-9);
}

TEST(ConfigValidation, ImplicitStartsChainFromPreviousEnd)
{
    trib::test_support::ScenarioBuilderOptions options;
    options.loads = {
        {.name = "a", .y_start = std::nullopt, .y_end = std::nullopt, .width = 0.5},
        {.name = "b", .y_start = std::nullopt, .y_end = 1.25},
        {.name = "c", .y_start = 2.0, .y_end = std::nullopt, .width = 0.0},
        {.name = "d", .y_start = std::nullopt, .y_end = std::nullopt, .width = 1.0},
    };
    const auto parsed = trib::test_support::load_scenario(options);
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    ASSERT_EQ(parsed->loads.size(), 4U);
    EXPECT_DOUBLE_EQ(parsed->loads[0].y_start, 0.0);
    EXPECT_DOUBLE_EQ(parsed->loads[0].y_end, 0.5);
    EXPECT_DOUBLE_EQ(parsed->loads[1].y_start, 0.5);
    EXPECT_DOUBLE_EQ(parsed->loads[1].y_end, 1.25);
    EXPECT_DOUBLE_EQ(parsed->loads[2].y_start, 2.0);
    EXPECT_DOUBLE_EQ(parsed->loads[2].y_end, 2.0);
    EXPECT_DOUBLE_EQ(parsed->loads[3].y_start, 2.0);
    EXPECT_DOUBLE_EQ(parsed->loads[3].y_end, 3.0);
}

TEST(ConfigValidation, ParsesToleranceUnitsAndOutputs)
{
    trib::test_support::ScenarioBuilderOptions options;
    options.tolerance      = 1.0e-6;
    options.include_units  = true;
    options.force_unit     = "lbf";
    options.length_unit    = "ft";
    options.include_output = true;
    options.output_report  = false;
    options.output_csv     = "out/contributions.csv";
    options.output_svg     = "out/layout.svg";

    const auto parsed = trib::test_support::load_scenario(options);
    ASSERT_TRUE(parsed.has_value()) << parsed.error().message;
    EXPECT_DOUBLE_EQ(parsed->tolerance.epsilon, 1.0e-6);
    EXPECT_EQ(parsed->units.force, "lbf");
    EXPECT_EQ(parsed->units.length, "ft");
    EXPECT_FALSE(parsed->output.report);
    ASSERT_TRUE(parsed->output.csv.has_value());
    EXPECT_EQ(parsed->output.csv->generic_string(), "out/contributions.csv");
    ASSERT_TRUE(parsed->output.svg.has_value());
    EXPECT_EQ(parsed->output.svg->generic_string(), "out/layout.svg");
}

TEST(ConfigValidation, BeamsOnlyAndLoadsOnlyAreAccepted)
{
    trib::test_support::ScenarioBuilderOptions beams_only;
    beams_only.include_loads = false;
    const auto no_loads      = trib::test_support::load_scenario(beams_only);
    ASSERT_TRUE(no_loads.has_value()) << no_loads.error().message;
    EXPECT_TRUE(no_loads->loads.empty());

    trib::test_support::ScenarioBuilderOptions loads_only;
    loads_only.beams    = {};
    const auto no_beams = trib::test_support::load_scenario(loads_only);
    ASSERT_TRUE(no_beams.has_value()) << no_beams.error().message;
    EXPECT_TRUE(no_beams->beams.empty());
}

TEST(ConfigValidation, ConvertsEntriesIntoModelValues)
{
    const auto config = make_good_config();
    const auto loads  = trib::config::make_loads(config);
    const auto beams  = trib::config::make_beams(config);

    ASSERT_EQ(loads.size(), 2U);
    EXPECT_EQ(loads[1].name, "G");
    EXPECT_DOUBLE_EQ(trib::model::width(loads[1]), 0.8);
    EXPECT_EQ(loads[1].color, "blue");
    ASSERT_EQ(beams.size(), 2U);
    EXPECT_EQ(beams[0].name, "P0");
    EXPECT_DOUBLE_EQ(beams[1].position, 1.0);
}

TEST(ConfigValidation, MissingFileReportsPath)
{
    const auto path   = test_data_path("definitely_not_here.yaml");
    const auto result = trib::config::load_config_from_file(path);
    ASSERT_FALSE(result.has_value());
    EXPECT_THAT(result.error().message, HasSubstr("unable to open config file"));
    EXPECT_THAT(result.error().context, ElementsAre(path.string()));
}

struct InvalidConfigCase
{
    std::string                                name;
    trib::test_support::ScenarioBuilderOptions options;
    std::string                                expected_message_substring;
    std::vector<std::string>                   expected_context;
    std::function<void(std::string &)>         mutate_yaml; ///< optional for bespoke tweaks
};

class ConfigInvalidTest : public ::testing::TestWithParam<InvalidConfigCase>
{};

TEST_P(ConfigInvalidTest, ReportsDetailedValidationErrors)
{
    auto yaml = trib::test_support::make_scenario_yaml(GetParam().options);
    if (GetParam().mutate_yaml)
    {
        GetParam().mutate_yaml(yaml);
    }
    const auto result = trib::config::load_config_from_string(yaml);
    ASSERT_FALSE(result.has_value()) << "expected failure for case: " << GetParam().name;
    EXPECT_THAT(result.error().message, HasSubstr(GetParam().expected_message_substring));
    if (!GetParam().expected_context.empty())
    {
        EXPECT_THAT(result.error().context, ElementsAreArray(GetParam().expected_context));
    }
}

auto make_invalid_cases() -> std::vector<InvalidConfigCase>
{
    using trib::test_support::BeamSpec;
    using trib::test_support::LoadSpec;
    using trib::test_support::ScenarioBuilderOptions;

    std::vector<InvalidConfigCase> cases;

    cases.push_back({"RootIsNotAMapping", ScenarioBuilderOptions{}, "config root must be a mapping", {},
                     [](std::string &yaml) { yaml = "- 1\n- 2\n"; }});
    cases.push_back({"MalformedYaml", ScenarioBuilderOptions{}, "YAML parse error", {},
                     [](std::string &yaml) { yaml = "loads: [\n  - {name: F\n"; }});

    {
        ScenarioBuilderOptions opts{};
        opts.tolerance = -1.0;
        cases.push_back({"NegativeTolerance", opts, "tolerance must be >= 0", {"tolerance"}, nullptr});
    }
    cases.push_back({"UnitsNotAMap", ScenarioBuilderOptions{}, "units must be a map", {"units"},
                     [](std::string &yaml) { yaml += "units: kN\n"; }});
    {
        ScenarioBuilderOptions opts{};
        opts.include_loads = false;
        cases.push_back({"LoadsNotASequence", opts, "loads must be a sequence", {"loads"},
                         [](std::string &yaml) { yaml += "loads: 3\n"; }});
    }
    {
        ScenarioBuilderOptions opts{};
        opts.include_beams = false;
        cases.push_back({"BeamsNotASequence", opts, "beams must be a sequence", {"beams"},
                         [](std::string &yaml) { yaml += "beams: {P0: 1}\n"; }});
    }
    {
        ScenarioBuilderOptions opts{};
        opts.include_loads = false;
        cases.push_back({"LoadEntryNotAMap", opts, "load entry must be a map", {"loads", "[0]"},
                         [](std::string &yaml) { yaml += "loads:\n  - 3\n"; }});
    }
    {
        ScenarioBuilderOptions opts{};
        opts.include_beams = false;
        cases.push_back({"BeamEntryNotAMap", opts, "beam entry must be a map", {"beams", "[0]"},
                         [](std::string &yaml) { yaml += "beams:\n  - [0, 1]\n"; }});
    }
    {
        ScenarioBuilderOptions opts{};
        opts.loads[0].name = "";
        cases.push_back({"EmptyLoadName", opts, "load.name must be a non-empty string", {"loads", "[0]", "name"},
                         nullptr});
    }
    {
        ScenarioBuilderOptions opts{};
        opts.loads[1].name = "F";
        cases.push_back({"DuplicateLoadNames", opts, "load names must be unique", {"loads", "[1]", "name"}, nullptr});
    }
    {
        ScenarioBuilderOptions opts{};
        opts.beams[1].name = "P0";
        cases.push_back({"DuplicateBeamNames", opts, "beam names must be unique", {"beams", "[1]", "name"}, nullptr});
    }
    cases.push_back({"MissingIntensity", ScenarioBuilderOptions{}, "missing required number 'intensity'",
                     {"loads", "[0]", "intensity"},
                     [](std::string &yaml) { replace_first(yaml, "    intensity: -0.72\n", ""); }});
    cases.push_back({"NonFiniteIntensity", ScenarioBuilderOptions{}, "intensity must be finite",
                     {"loads", "[0]", "intensity"},
                     [](std::string &yaml) { replace_first(yaml, "intensity: -0.72", "intensity: .inf"); }});
    cases.push_back({"MissingPosition", ScenarioBuilderOptions{}, "missing required number 'position'",
                     {"beams", "[0]", "position"},
                     [](std::string &yaml) { replace_first(yaml, "    position: 0\n", ""); }});
    cases.push_back({"NonNumericPosition", ScenarioBuilderOptions{}, "bad conversion", {"beams", "[0]", "position"},
                     [](std::string &yaml) { replace_first(yaml, "position: 0\n", "position: left\n"); }});
    {
        ScenarioBuilderOptions opts{};
        opts.loads[0].width = 0.2;
        cases.push_back({"BothEndAndWidth", opts, "either y_end or width, not both", {"loads", "[0]", "width"},
                         nullptr});
    }
    {
        ScenarioBuilderOptions opts{};
        opts.loads[0].y_end = std::nullopt;
        cases.push_back({"NeitherEndNorWidth", opts, "load needs y_end or width", {"loads", "[0]", "y_end"},
                         nullptr});
    }
    {
        ScenarioBuilderOptions opts{};
        opts.loads[0].y_end = std::nullopt;
        opts.loads[0].width = -0.5;
        cases.push_back({"NegativeWidth", opts, "load.width must be >= 0", {"loads", "[0]", "width"}, nullptr});
    }
    {
        ScenarioBuilderOptions opts{};
        opts.loads[1] = LoadSpec{.name = "G", .y_start = 1.0, .y_end = 0.5};
        cases.push_back({"InvertedLoad", opts, "load.y_end must be >= load.y_start", {"loads", "[1]", "y_end"},
                         nullptr});
    }
    {
        ScenarioBuilderOptions opts{};
        opts.loads[0].length = -2.5;
        cases.push_back({"NegativeLoadLength", opts, "load.length must be >= 0", {"loads", "[0]", "length"}, nullptr});
    }
    {
        ScenarioBuilderOptions opts{};
        opts.beams[0] = BeamSpec{.name = "P0", .position = 0.0, .length = -1.0};
        cases.push_back({"NegativeBeamLength", opts, "beam.length must be >= 0", {"beams", "[0]", "length"}, nullptr});
    }
    {
        ScenarioBuilderOptions opts{};
        opts.include_units = true;
        opts.include_loads = false;
        opts.include_beams = false;
        cases.push_back({"NothingToDistribute", opts, "at least one load or beam", {"loads", "beams"}, nullptr});
    }
    {
        ScenarioBuilderOptions opts{};
        opts.loads = {};
        opts.beams = {};
        cases.push_back({"EmptyLists", opts, "at least one load or beam", {"loads", "beams"}, nullptr});
    }
    cases.push_back({"OutputNotAMap", ScenarioBuilderOptions{}, "output must be a map", {"output"},
                     [](std::string &yaml) { yaml += "output: yes\n"; }});

    return cases;
}

INSTANTIATE_TEST_SUITE_P(ExhaustiveInvalidConfigs, ConfigInvalidTest, ::testing::ValuesIn(make_invalid_cases()),
                         [](const ::testing::TestParamInfo<InvalidConfigCase> &test_info) {
                             return test_info.param.name;
                         });
