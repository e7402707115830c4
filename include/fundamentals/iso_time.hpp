#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace iso_time
{

using time_point = std::chrono::system_clock::time_point;

// "2026-10-18T09:30:00.125Z"
[[nodiscard]] std::string format(time_point tp);

// Rounds up, so a parsed deadline is never earlier than tp.
[[nodiscard]] std::string format_deadline(time_point tp);

// Accepts the format() output, with or without fractional seconds.
[[nodiscard]] std::optional<time_point> parse(std::string_view text);

} // namespace iso_time
