// Tools for formatting strings and timestamps
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

#include "elworkbench_utils_export.h"

namespace elworkbench::format_tools
{

// Local time with microsecond resolution: "YYYY-MM-DD HH:MM:SS.ffffff".
ELWORKBENCH_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

// Local time suitable for a file name: "YYYY-MM-DD_HH-MM-SS".
ELWORKBENCH_UTILS_EXPORT std::string
filename_timestamp(std::chrono::system_clock::time_point timestamp);

// Inverse of filename_timestamp(); nullopt when @p stem does not have that shape.
ELWORKBENCH_UTILS_EXPORT std::optional<std::chrono::system_clock::time_point>
parse_filename_timestamp(std::string_view stem);

} // namespace elworkbench::format_tools
