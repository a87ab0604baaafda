#include "flakeid/core/time.h"

#include <iomanip>
#include <sstream>

namespace flakeid::core {

namespace {

// Parses exactly `width` decimal digits starting at `pos`.
std::optional<int> parse_digits(std::string_view text, std::size_t pos, std::size_t width) {
  if (pos + width > text.size()) {
    return std::nullopt;
  }
  int value = 0;
  for (std::size_t i = pos; i < pos + width; ++i) {
    const char c = text[i];
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + (c - '0');
  }
  return value;
}

}  // namespace

Timestamp make_utc_date(const int year, const unsigned month, const unsigned day) {
  const std::chrono::year_month_day ymd{std::chrono::year{year}, std::chrono::month{month},
                                        std::chrono::day{day}};
  return Timestamp{std::chrono::sys_days{ymd}};
}

std::optional<Timestamp> parse_iso8601_utc(const std::string_view text) {
  // Date part: YYYY-MM-DD
  if (text.size() < 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  const auto year = parse_digits(text, 0, 4);
  const auto month = parse_digits(text, 5, 2);
  const auto day = parse_digits(text, 8, 2);
  if (!year || !month || !day) {
    return std::nullopt;
  }

  const std::chrono::year_month_day ymd{std::chrono::year{*year},
                                        std::chrono::month{static_cast<unsigned>(*month)},
                                        std::chrono::day{static_cast<unsigned>(*day)}};
  if (!ymd.ok()) {
    return std::nullopt;
  }

  // Timestamp counts nanoseconds in a signed 64-bit integer; keep one day of headroom at
  // either end so the time-of-day offset below cannot overflow it.
  const std::chrono::sys_days date{ymd};
  if (date <= std::chrono::floor<std::chrono::days>(Timestamp::min()) + std::chrono::days{1} ||
      date >= std::chrono::floor<std::chrono::days>(Timestamp::max()) - std::chrono::days{1}) {
    return std::nullopt;
  }

  Timestamp result{date};
  if (text.size() == 10) {
    return result;
  }

  // Time part: THH:MM:SS[.mmm]Z
  if (text.size() < 20 || text[10] != 'T' || text[13] != ':' || text[16] != ':' ||
      text.back() != 'Z') {
    return std::nullopt;
  }
  const auto hour = parse_digits(text, 11, 2);
  const auto minute = parse_digits(text, 14, 2);
  const auto second = parse_digits(text, 17, 2);
  if (!hour || !minute || !second || *hour > 23 || *minute > 59 || *second > 59) {
    return std::nullopt;
  }

  int millis = 0;
  if (text.size() == 24) {
    if (text[19] != '.') {
      return std::nullopt;
    }
    const auto fraction = parse_digits(text, 20, 3);
    if (!fraction) {
      return std::nullopt;
    }
    millis = *fraction;
  } else if (text.size() != 20) {
    return std::nullopt;
  }

  result += std::chrono::hours{*hour} + std::chrono::minutes{*minute} +
            std::chrono::seconds{*second} + std::chrono::milliseconds{millis};
  return result;
}

std::string format_iso8601_utc(const Timestamp ts) {
  return format_iso8601_utc(to_millis_timestamp(ts));
}

std::string format_iso8601_utc(const MillisTimestamp ts) {
  const auto days = std::chrono::floor<std::chrono::days>(ts);
  const std::chrono::year_month_day ymd{days};
  const std::chrono::hh_mm_ss tod{ts - days};

  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << static_cast<int>(ymd.year()) << '-'
      << std::setw(2) << static_cast<unsigned>(ymd.month()) << '-' << std::setw(2)
      << static_cast<unsigned>(ymd.day()) << 'T' << std::setw(2) << tod.hours().count() << ':'
      << std::setw(2) << tod.minutes().count() << ':' << std::setw(2) << tod.seconds().count()
      << '.' << std::setw(3) << tod.subseconds().count() << 'Z';
  return oss.str();
}

}  // namespace flakeid::core
