#include "flakeid/core/time.h"
#include "flakeid/generator/epoch.h"
#include "flakeid/generator/id_layout.h"

#include <catch2/catch_test_macros.hpp>

#include <chrono>

using namespace flakeid;

TEST_CASE("default_start_epoch: 2017-01-01T00:00:00Z", "[epoch]") {
  CHECK(core::to_unix_millis(generator::default_start_epoch()) == 1483228800000);
}

TEST_CASE("is_valid_start_epoch: bounds are inclusive", "[epoch]") {
  CHECK(generator::is_valid_start_epoch(core::make_utc_date(1970, 1, 1)));
  CHECK(generator::is_valid_start_epoch(core::make_utc_date(2262, 1, 1)));
  CHECK(generator::is_valid_start_epoch(core::make_utc_date(2017, 1, 1)));

  CHECK_FALSE(generator::is_valid_start_epoch(core::make_utc_date(1969, 12, 31)));
  CHECK_FALSE(generator::is_valid_start_epoch(core::make_utc_date(2262, 1, 2)));
  CHECK_FALSE(generator::is_valid_start_epoch(core::make_utc_date(1970, 1, 1) -
                                              std::chrono::milliseconds{1}));
}

TEST_CASE("epoch_validity: start epoch plus 2^42 - 1 ms", "[epoch]") {
  const auto validity = generator::epoch_validity(generator::default_start_epoch());
  CHECK(core::to_unix_millis(validity) == 1483228800000 + 4398046511103);
  CHECK(core::format_iso8601_utc(validity) == "2156-05-15T07:35:11.103Z");
}

TEST_CASE("epoch_validity: late epochs resolve past the nanosecond Timestamp range",
          "[epoch]") {
  const auto late = generator::epoch_validity(core::make_utc_date(2200, 1, 1));
  CHECK(core::format_iso8601_utc(late) == "2339-05-16T07:35:11.103Z");
  CHECK(late > core::to_millis_timestamp(core::Timestamp::max()));

  const auto last = generator::epoch_validity(generator::max_start_epoch());
  CHECK(core::format_iso8601_utc(last) == "2401-05-15T07:35:11.103Z");
}

TEST_CASE("id_timestamp: instant embedded in an ID", "[epoch]") {
  const auto epoch = generator::default_start_epoch();
  const auto id = generator::compose_id(1500, 1, 2, 3);
  CHECK(generator::id_timestamp(id, epoch) == epoch + std::chrono::milliseconds{1500});
}

TEST_CASE("id_timestamp: IDs near the horizon of a late epoch", "[epoch]") {
  const auto epoch = core::make_utc_date(2200, 1, 1);
  const auto id = generator::compose_id(generator::kMaxTimestampMillis, 0, 0, 0);
  CHECK(generator::id_timestamp(id, epoch) == generator::epoch_validity(epoch));
}
