/**
 * @file csv_writer.cpp
 * @brief implementation of the contribution CSV export uwu
 */
#include "trib/post/csv_writer.hpp"

#include <fstream>
#include <sstream>
#include <system_error>

namespace trib::post
{
namespace
{

[[nodiscard]] auto make_error(std::string message, std::initializer_list<std::string> ctx = {}) -> CsvError
{
    CsvError err{};
    err.message = std::move(message);
    err.context.assign(ctx.begin(), ctx.end());
    return err;
}

[[nodiscard]] auto quote(const std::string &field) -> std::string
{
    if (field.find_first_of(",\"\n") == std::string::npos)
    {
        return field;
    }
    std::string quoted{"\""};
    for (const char c : field)
    {
        if (c == '"')
        {
            quoted.push_back('"');
        }
        quoted.push_back(c);
    }
    quoted.push_back('"');
    return quoted;
}

} // namespace

auto format_contributions_csv(const model::DistributionResult &result) -> std::string
{
    std::ostringstream oss;
    oss.setf(std::ios::fixed, std::ios::floatfield);
    oss.precision(9);

    oss << "beam,position,zone_lower,zone_upper,load,start,end,width,value\n";
    for (const auto &beam : result.beams)
    {
        double summed_width = 0.0;
        for (const auto &contribution : beam.contributions)
        {
            oss << quote(beam.beam_name) << ',' << beam.position << ',' << beam.zone.start << ','
                << beam.zone.end << ',' << quote(contribution.load_name) << ',' << contribution.start << ','
                << contribution.end << ',' << contribution.width << ',' << contribution.value << '\n';
            summed_width += contribution.width;
        }
        oss << quote(beam.beam_name) << ',' << beam.position << ',' << beam.zone.start << ',' << beam.zone.end
            << ",TOTAL,,," << summed_width << ',' << beam.total << '\n';
    }
    return oss.str();
}

auto write_contributions_csv(const std::filesystem::path &path, const model::DistributionResult &result)
    -> std::expected<void, CsvError>
{
    if (!path.parent_path().empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec)
        {
            return std::unexpected(make_error("failed to create CSV directory: " + ec.message(), {path.string()}));
        }
    }

    std::ofstream file(path, std::ios::trunc);
    if (!file)
    {
        return std::unexpected(make_error("failed to open contribution CSV", {path.string()}));
    }
    file << format_contributions_csv(result);
    if (!file)
    {
        return std::unexpected(make_error("failed to write contribution CSV", {path.string()}));
    }
    return {};
}

} // namespace trib::post
