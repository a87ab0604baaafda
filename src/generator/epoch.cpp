#include "flakeid/generator/epoch.h"

#include "flakeid/generator/id_layout.h"

#include <chrono>

namespace flakeid::generator {

core::Timestamp min_start_epoch() {
  return core::make_utc_date(1970, 1, 1);
}

core::Timestamp max_start_epoch() {
  return core::make_utc_date(2262, 1, 1);
}

core::Timestamp default_start_epoch() {
  return core::make_utc_date(2017, 1, 1);
}

bool is_valid_start_epoch(const core::Timestamp epoch) {
  return epoch >= min_start_epoch() && epoch <= max_start_epoch();
}

core::MillisTimestamp epoch_validity(const core::Timestamp start_epoch) {
  return core::to_millis_timestamp(start_epoch) + std::chrono::milliseconds{kMaxTimestampMillis};
}

core::MillisTimestamp id_timestamp(const std::uint64_t id, const core::Timestamp start_epoch) {
  return core::to_millis_timestamp(start_epoch) +
         std::chrono::milliseconds{decode_id(id).timestamp_ms};
}

}  // namespace flakeid::generator
