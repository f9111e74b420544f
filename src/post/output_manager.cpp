/**
 * @file output_manager.cpp
 * @brief orchestration logic for scenario exports uwu
 */
#include "trib/post/output_manager.hpp"

#include <string_view>

#include "trib/post/csv_writer.hpp"
#include "trib/post/svg_writer.hpp"

namespace trib::post
{
namespace
{

template <typename ErrorPayload>
[[nodiscard]] auto wrap_error(std::string_view label, const ErrorPayload &child_error) -> OutputError
{
    OutputError err{};
    err.message = std::string(label) + ": " + child_error.message;
    err.context = child_error.context;
    return err;
}

} // namespace

OutputManager::OutputManager(std::filesystem::path root, config::OutputSettings settings, config::Units units)
    : root_{std::move(root)}, settings_{std::move(settings)}, units_{std::move(units)}
{
}

auto OutputManager::resolve(const std::filesystem::path &target) const -> std::filesystem::path
{
    if (target.is_absolute() || root_.empty())
    {
        return target;
    }
    return root_ / target;
}

auto OutputManager::handle_result(std::span<const model::RegionalLoad> loads, const model::DistributionResult &result)
    -> std::expected<std::vector<std::filesystem::path>, OutputError>
{
    std::vector<std::filesystem::path> written;

    if (settings_.csv)
    {
        const auto path = resolve(*settings_.csv);
        if (auto csv = write_contributions_csv(path, result); !csv)
        {
            return std::unexpected(wrap_error("csv", csv.error()));
        }
        written.push_back(path);
    }

    if (settings_.svg)
    {
        SvgOptions options{};
        options.units   = units_;
        const auto path = resolve(*settings_.svg);
        if (auto svg = write_layout_svg(path, loads, result, options); !svg)
        {
            return std::unexpected(wrap_error("svg", svg.error()));
        }
        written.push_back(path);
    }

    return written;
}

} // namespace trib::post
