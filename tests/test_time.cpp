#include "flakeid/core/time.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace flakeid::core;

// ── make_utc_date / unix millis ─────────────────────────────────────────────

TEST_CASE("make_utc_date: midnight UTC of the civil date", "[time]") {
  CHECK(to_unix_millis(make_utc_date(1970, 1, 1)) == 0);
  CHECK(to_unix_millis(make_utc_date(2017, 1, 1)) == 1483228800000);
  CHECK(to_unix_millis(make_utc_date(2262, 1, 1)) == 9214646400000);
}

TEST_CASE("from_unix_millis: inverse of to_unix_millis", "[time]") {
  CHECK(to_unix_millis(from_unix_millis(1483228800123)) == 1483228800123);
}

// ── parse_iso8601_utc ───────────────────────────────────────────────────────

TEST_CASE("parse_iso8601_utc: date only", "[time]") {
  const auto ts = parse_iso8601_utc("2017-01-01");
  REQUIRE(ts.has_value());
  CHECK(ts.value() == make_utc_date(2017, 1, 1));
}

TEST_CASE("parse_iso8601_utc: date and time", "[time]") {
  const auto ts = parse_iso8601_utc("2017-01-01T12:34:56Z");
  REQUIRE(ts.has_value());
  CHECK(ts.value() == make_utc_date(2017, 1, 1) + std::chrono::hours{12} +
                          std::chrono::minutes{34} + std::chrono::seconds{56});
}

TEST_CASE("parse_iso8601_utc: milliseconds", "[time]") {
  const auto ts = parse_iso8601_utc("2017-01-01T00:00:00.789Z");
  REQUIRE(ts.has_value());
  CHECK(to_unix_millis(ts.value()) == 1483228800789);
}

TEST_CASE("parse_iso8601_utc: leap day only in leap years", "[time]") {
  CHECK(parse_iso8601_utc("2020-02-29").has_value());
  CHECK_FALSE(parse_iso8601_utc("2019-02-29").has_value());
}

TEST_CASE("parse_iso8601_utc: rejects malformed input", "[time]") {
  CHECK_FALSE(parse_iso8601_utc("").has_value());
  CHECK_FALSE(parse_iso8601_utc("20170101").has_value());
  CHECK_FALSE(parse_iso8601_utc("2017-13-01").has_value());
  CHECK_FALSE(parse_iso8601_utc("2017-02-30").has_value());
  CHECK_FALSE(parse_iso8601_utc("2017-01-01T24:00:00Z").has_value());
  CHECK_FALSE(parse_iso8601_utc("2017-01-01T00:60:00Z").has_value());
  CHECK_FALSE(parse_iso8601_utc("2017-01-01 00:00:00Z").has_value());
  CHECK_FALSE(parse_iso8601_utc("2017-01-01T00:00:00").has_value());
  CHECK_FALSE(parse_iso8601_utc("2017-01-01T00:00:00+01:00").has_value());
  CHECK_FALSE(parse_iso8601_utc("2017-01-01T00:00:00.12Z").has_value());
  CHECK_FALSE(parse_iso8601_utc("-017-01-01").has_value());
}

TEST_CASE("parse_iso8601_utc: rejects dates outside the representable range", "[time]") {
  CHECK_FALSE(parse_iso8601_utc("9999-01-01").has_value());
  CHECK_FALSE(parse_iso8601_utc("1000-01-01").has_value());
  CHECK(parse_iso8601_utc("2262-01-02").has_value());
}

// ── format_iso8601_utc ──────────────────────────────────────────────────────

TEST_CASE("format_iso8601_utc: millisecond precision", "[time]") {
  CHECK(format_iso8601_utc(make_utc_date(2017, 1, 1)) == "2017-01-01T00:00:00.000Z");
  CHECK(format_iso8601_utc(from_unix_millis(1483228800789)) == "2017-01-01T00:00:00.789Z");
}

TEST_CASE("format_iso8601_utc: instants before 1970", "[time]") {
  CHECK(format_iso8601_utc(make_utc_date(1969, 12, 31)) == "1969-12-31T00:00:00.000Z");
  CHECK(format_iso8601_utc(from_unix_millis(-1)) == "1969-12-31T23:59:59.999Z");
}

TEST_CASE("format_iso8601_utc: accepted by parse_iso8601_utc", "[time]") {
  const auto ts = from_unix_millis(1700000000123);
  const auto parsed = parse_iso8601_utc(format_iso8601_utc(ts));
  REQUIRE(parsed.has_value());
  CHECK(parsed.value() == ts);
}
