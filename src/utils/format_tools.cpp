// format_tools.cpp
#include "format_tools.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace elworkbench::format_tools
{

// Two-step format: whole seconds through fmt's chrono support, then the
// microsecond fraction appended manually so the output does not depend on
// how the installed fmt renders sub-second durations.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    const std::time_t t = std::chrono::system_clock::to_time_t(secs);
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(t));
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string filename_timestamp(std::chrono::system_clock::time_point timestamp)
{
    const std::time_t t = std::chrono::system_clock::to_time_t(timestamp);
    return fmt::format("{:%Y-%m-%d_%H-%M-%S}", fmt::localtime(t));
}

std::optional<std::chrono::system_clock::time_point> parse_filename_timestamp(std::string_view stem)
{
    // "YYYY-MM-DD_HH-MM-SS"
    if (stem.size() != 19)
        return std::nullopt;

    std::tm tm{};
    std::istringstream in{std::string(stem)};
    in >> std::get_time(&tm, "%Y-%m-%d_%H-%M-%S");
    if (in.fail())
        return std::nullopt;

    tm.tm_isdst = -1;
    const std::time_t t = std::mktime(&tm);
    if (t == static_cast<std::time_t>(-1))
        return std::nullopt;
    return std::chrono::system_clock::from_time_t(t);
}

} // namespace elworkbench::format_tools
