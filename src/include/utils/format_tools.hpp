// Tools for formatting strings
#pragma once
#include <chrono>
#include <string>
#include <string_view>

#include <fmt/format.h>

#include "agentgate_utils_export.h"

namespace agentgate::format_tools
{

/**
 * @brief Formats a system_clock time_point into a string with microsecond precision.
 * @param timestamp The time_point to format.
 * @return A string in the format "YYYY-MM-DD HH:MM:SS.us".
 */
AGENTGATE_UTILS_EXPORT std::string formatted_time(std::chrono::system_clock::time_point timestamp);

/**
 * @brief Renders bytes for a log line, replacing control characters with '?'.
 *
 * Text read off an unauthenticated socket goes through this before it reaches a
 * log sink, so a peer cannot forge extra log lines with embedded newlines.
 * Output is truncated to @p max_len bytes with a trailing "..." marker.
 */
AGENTGATE_UTILS_EXPORT std::string printable(std::string_view input, size_t max_len = 128);

} // namespace agentgate::format_tools
