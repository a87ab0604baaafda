#pragma once

#include "flakeid/core/time.h"

#include <cstdint>

namespace flakeid::generator {

// Start epochs must lie in [1970-01-01T00:00:00Z, 2262-01-01T00:00:00Z]. The upper bound keeps
// elapsed time since the Unix epoch representable as signed 64-bit nanoseconds.
[[nodiscard]] core::Timestamp min_start_epoch();
[[nodiscard]] core::Timestamp max_start_epoch();

// default_start_epoch is 2017-01-01T00:00:00Z.
[[nodiscard]] core::Timestamp default_start_epoch();

[[nodiscard]] bool is_valid_start_epoch(core::Timestamp epoch);

// epoch_validity returns the last instant whose elapsed milliseconds since start_epoch still fit
// the 42-bit timestamp field: start_epoch + (2^42 - 1) ms. IDs minted after it collide.
// Millisecond precision, so late epochs whose horizon lies past Timestamp::max() still resolve.
[[nodiscard]] core::MillisTimestamp epoch_validity(core::Timestamp start_epoch);

// id_timestamp returns the instant embedded in an ID minted against start_epoch.
[[nodiscard]] core::MillisTimestamp id_timestamp(std::uint64_t id, core::Timestamp start_epoch);

}  // namespace flakeid::generator
