#pragma once

#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>

namespace depot {

// -------------------------------------------------------------------------
// formatIso8601
// -------------------------------------------------------------------------
// @brief  Renders epoch milliseconds as an ISO-8601 UTC string with
//         millisecond precision, e.g. "2026-10-18T08:15:00.123Z".
//
// @details
// Used by the JSON renderers so exported transfers and audit entries carry
// a human-readable time next to the raw millisecond value.
// Thread-safety: Stateless (uses gmtime_r), safe from any thread.
// -------------------------------------------------------------------------
inline std::string formatIso8601(std::int64_t epoch_ms) {
  std::int64_t seconds = epoch_ms / 1000;
  int millis = static_cast<int>(epoch_ms % 1000);
  if (millis < 0) {
    millis += 1000;
    seconds -= 1;
  }

  std::time_t tt = static_cast<std::time_t>(seconds);
  std::tm tm_utc{};
  gmtime_r(&tt, &tm_utc);

  char date_part[32];
  std::strftime(date_part, sizeof(date_part), "%Y-%m-%dT%H:%M:%S", &tm_utc);

  char full[48];
  std::snprintf(full, sizeof(full), "%s.%03dZ", date_part, millis);
  return full;
}

}  // namespace depot
