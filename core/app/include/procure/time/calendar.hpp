#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace procure {

// -----------------------------------------------------------------------------
// TimestampMs
// -----------------------------------------------------------------------------
// Epoch milliseconds (UTC). Every date the simulation stores (simulated clock,
// price history points, contract spans, order delivery dates) is carried as
// this integer and rendered to text only at the serialization boundary.
// -----------------------------------------------------------------------------
using TimestampMs = std::int64_t;

inline constexpr TimestampMs kMillisPerDay = 86'400'000;

// -----------------------------------------------------------------------------
// Calendar utilities
// -----------------------------------------------------------------------------
//
// @brief  Free functions converting between TimestampMs and the two textual
//         date shapes the engine exchanges with its callers:
//           - plain date:     "YYYY-MM-DD"
//           - full timestamp: "YYYY-MM-DDTHH:MM:SS" (optional ".fff", "Z")
//
// @details
// All conversions are proleptic Gregorian and UTC; there is no time-zone
// handling. Civil <-> day-count conversion uses the days_from_civil /
// civil_from_days algorithms so no platform gmtime/timegm call is needed.
//
// Thread-safety: Stateless, safe to call from any thread.
// -----------------------------------------------------------------------------

// Days since 1970-01-01 for the given civil date. Month is 1..12.
std::int64_t daysFromCivil(std::int64_t year, unsigned month, unsigned day);

// Midnight of the given civil date as epoch milliseconds.
TimestampMs makeTimestamp(std::int64_t year, unsigned month, unsigned day,
                          unsigned hour = 0, unsigned minute = 0,
                          unsigned second = 0);

// "YYYY-MM-DD"
std::string formatDate(TimestampMs ts);

// "YYYY-MM-DDTHH:MM:SS"
std::string formatIsoTimestamp(TimestampMs ts);

// "YYYYMMDDHHMMSS", used to build entity identifiers.
std::string formatCompactTimestamp(TimestampMs ts);

// -------------------------------------------------------------------------
// parseTimestamp(text)
// -------------------------------------------------------------------------
// @brief  Parses either accepted date shape.
//
// @return Epoch milliseconds, or std::nullopt when the text matches neither
//         shape or names an impossible calendar date (e.g. month 13).
//
// @details
// Accepted:
//   2024-03-15
//   2024-03-15T08:30:00
//   2024-03-15T08:30:00.123456
//   2024-03-15T08:30:00Z
// A space is accepted in place of the 'T' separator. Fractional seconds are
// truncated to milliseconds.
// -------------------------------------------------------------------------
std::optional<TimestampMs> parseTimestamp(const std::string& text);

// Whole days from `from` to `to`, floored (a negative partial day is -1).
std::int64_t daysBetween(TimestampMs from, TimestampMs to);

inline TimestampMs addDays(TimestampMs ts, std::int64_t days) {
  return ts + days * kMillisPerDay;
}

}  // namespace procure
