#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace graph_util {

// ISO-8601 -> epoch milliseconds (UTC). Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM[:SS[.ffffff]]"
// with an optional "Z", "+HH:MM", "+HHMM" or "+HH" suffix. A space may replace the 'T'.
// Impossible calendar dates (2025-02-31) are rejected.
std::optional<std::int64_t> parse_iso8601_ms(const std::string& text);

// Epoch milliseconds -> "YYYY-MM-DDTHH:MM:SS.sssZ".
std::string format_iso8601_ms(std::int64_t epoch_ms);

// Display form "YYYY-MM-DD HH:MM" (UTC). Empty input gives "-", unparsable input is returned as is.
std::string format_timestamp(const std::string& iso);

} // namespace graph_util
