#pragma once

#include <ytplay/ytplay_export.h>

#include <string>
#include <string_view>
#include <ytplay/result.hpp>

namespace ytplay {

/// Parse "SS", "M:SS" or "H:MM:SS" into seconds. Minutes and seconds are not
/// range checked, so "75:00" is accepted.
YTPLAY_EXPORT Result<long long> parse_duration(std::string_view text);

/// Format seconds as "M:SS"; minutes keep counting past 59. Negative input
/// formats as "0:00".
YTPLAY_EXPORT std::string format_duration(long long seconds);

}  // namespace ytplay
