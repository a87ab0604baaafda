#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace flakeid::core {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

// Millisecond-resolution instant. Covers far more years than the nanosecond Timestamp; used for
// values derived from IDs, whose horizon can lie past Timestamp::max().
using MillisTimestamp = std::chrono::sys_time<std::chrono::milliseconds>;

inline Timestamp now_utc() { return Clock::now(); }

inline std::int64_t to_unix_millis(const Timestamp ts) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(ts.time_since_epoch()).count();
}

inline std::int64_t to_unix_millis(const MillisTimestamp ts) {
  return ts.time_since_epoch().count();
}

inline MillisTimestamp to_millis_timestamp(const Timestamp ts) {
  return std::chrono::floor<std::chrono::milliseconds>(ts);
}

inline Timestamp from_unix_millis(const std::int64_t millis) {
  return Timestamp{std::chrono::milliseconds{millis}};
}

// make_utc_date returns midnight UTC of the given civil date.
// Precondition: year/month/day form a valid Gregorian date.
[[nodiscard]] Timestamp make_utc_date(int year, unsigned month, unsigned day);

// parse_iso8601_utc accepts:
//   YYYY-MM-DD
//   YYYY-MM-DDTHH:MM:SSZ
//   YYYY-MM-DDTHH:MM:SS.mmmZ
// Returns nullopt for anything else, including out-of-range calendar fields.
[[nodiscard]] std::optional<Timestamp> parse_iso8601_utc(std::string_view text);

// format_iso8601_utc renders ts with millisecond precision,
// e.g. "2017-01-01T00:00:00.000Z".
[[nodiscard]] std::string format_iso8601_utc(Timestamp ts);
[[nodiscard]] std::string format_iso8601_utc(MillisTimestamp ts);

}  // namespace flakeid::core
