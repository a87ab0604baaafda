#include "flakeid/core/clock.h"
#include "flakeid/core/time.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace flakeid::core;

TEST_CASE("SystemClock: tracks the wall clock", "[clock]") {
  SystemClock clock;
  const auto before = now_utc();
  const auto reading = clock.now();
  const auto after = now_utc();

  CHECK(reading >= before);
  CHECK(reading <= after);
}

TEST_CASE("FixedClock: constant until moved", "[clock]") {
  const auto start = make_utc_date(2026, 1, 1);
  FixedClock clock(start);

  CHECK(clock.now() == start);
  CHECK(clock.now() == start);

  clock.advance(std::chrono::milliseconds{5});
  CHECK(clock.now() == start + std::chrono::milliseconds{5});

  clock.set(start - std::chrono::seconds{1});
  CHECK(clock.now() == start - std::chrono::seconds{1});
}

TEST_CASE("FunctionClock: forwards to the wrapped callable", "[clock]") {
  int calls = 0;
  const auto base = make_utc_date(2020, 5, 5);
  FunctionClock clock([&calls, base] {
    ++calls;
    return base + std::chrono::milliseconds{calls};
  });

  CHECK(clock.now() == base + std::chrono::milliseconds{1});
  CHECK(clock.now() == base + std::chrono::milliseconds{2});
  CHECK(calls == 2);
}
