// format_tools.cpp
#include "agentgate_base.hpp"

#include <fmt/chrono.h>

namespace agentgate::format_tools
{

// Formatted local time with microsecond resolution.
// fmt's subsecond support for time_point varies between releases, so the
// fraction is computed here and appended in a second step.
std::string formatted_time(std::chrono::system_clock::time_point timestamp)
{
    auto tp_us = std::chrono::time_point_cast<std::chrono::microseconds>(timestamp);
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp_us);
    auto us = std::chrono::duration_cast<std::chrono::microseconds>(tp_us - secs).count();
    // normalize to 0..999999 even for negative timestamps
    int fractional_us = static_cast<int>(us % 1000000);
    if (fractional_us < 0)
        fractional_us += 1000000;
    std::time_t tt = std::chrono::system_clock::to_time_t(secs);
    auto sec_part = fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(tt));
    return fmt::format("{}.{:06d}", sec_part, fractional_us);
}

std::string printable(std::string_view input, size_t max_len)
{
    std::string out;
    const bool truncated = input.size() > max_len;
    const auto view = truncated ? input.substr(0, max_len) : input;
    out.reserve(view.size() + 3);
    for (char c : view)
    {
        const auto uc = static_cast<unsigned char>(c);
        out.push_back((uc < 0x20 || uc == 0x7f) ? '?' : c);
    }
    if (truncated)
        out += "...";
    return out;
}

} // namespace agentgate::format_tools
