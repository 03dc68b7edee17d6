#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace cedu::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

// Formats unix milliseconds as "YYYY-MM-DDTHH:MM:SSZ" (UTC, second precision).
[[nodiscard]] std::string format_iso8601_utc(std::int64_t unix_millis);

// Parses an RFC 3339 timestamp ("2026-01-01T10:00:00Z", "2026-01-01T10:00:00.250+02:00")
// into unix milliseconds. Returns nullopt for anything it does not recognise.
[[nodiscard]] std::optional<std::int64_t> parse_rfc3339_millis(std::string_view text);

}  // namespace cedu::core
