#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/core/result.h"
#include "flakeid/core/time.h"
#include "flakeid/generator/errors.h"
#include "flakeid/generator/options.h"

#include <cstdint>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace flakeid::generator {

// IdGenerator mints 64-bit IDs laid out as
// [42-bit elapsed ms][2-bit node][5-bit component][15-bit sequence] (see id_layout.h).
//
// Guarantees, for one instance whose clock never goes backwards and stays inside
// epoch_validity(): IDs are unique and non-decreasing in emission order.
//
// Thread-safety: a single mutex guards (last_timestamp, sequence) across the whole of next_id,
// including the clock read and the wait for the next millisecond after sequence exhaustion.
// Concurrent callers serialize; an exhaustion stall blocks all of them.
//
// No coordination between instances: callers assign disjoint (component, node) pairs.
class IdGenerator {
 public:
  // Builds a generator from the defaults (component 0, node 0, start epoch 2017-01-01Z,
  // system clock) with options applied in order. The first rejected option aborts construction.
  [[nodiscard]] static core::Result<std::shared_ptr<IdGenerator>, ConfigError> create(
      const std::vector<Option>& options = {});

  ~IdGenerator() = default;

  // Not copyable or movable (owns mutex and sequence state)
  IdGenerator(const IdGenerator&) = delete;
  IdGenerator& operator=(const IdGenerator&) = delete;
  IdGenerator(IdGenerator&&) = delete;
  IdGenerator& operator=(IdGenerator&&) = delete;

  // Returns the next ID, or ClockRegressionError if the clock reads earlier than the last
  // emission. On error the generator state is unchanged.
  // May block (busy-wait) when 2^15 IDs were already minted in the current millisecond.
  [[nodiscard]] core::Result<std::uint64_t, ClockRegressionError> next_id();

  // next_id rendered in base 10.
  [[nodiscard]] core::Result<std::string, ClockRegressionError> next_id_string();

  // Retries next_id until it succeeds. Blocks for as long as the clock keeps regressing;
  // there is no timeout.
  std::uint64_t next_valid_id();

  // next_valid_id rendered in base 10.
  std::string next_valid_id_string();

  // Last instant for which elapsed ms since start_epoch() fits the 42-bit timestamp field.
  [[nodiscard]] core::MillisTimestamp epoch_validity() const;

  [[nodiscard]] std::uint64_t component_id() const { return component_id_; }
  [[nodiscard]] std::uint64_t node_id() const { return node_id_; }
  [[nodiscard]] core::Timestamp start_epoch() const { return start_epoch_; }

 private:
  // Sentinel for "nothing emitted yet". Below every clock reading, including readings taken
  // before the start epoch, so the first call always starts a fresh millisecond bucket.
  static constexpr std::int64_t kUninitializedTimestamp =
      std::numeric_limits<std::int64_t>::min();

  explicit IdGenerator(const GeneratorConfig& config);

  // Whole milliseconds elapsed since start_epoch_ according to clock_.
  [[nodiscard]] std::int64_t elapsed_millis() const;

  // Busy-polls the clock until it reports a millisecond strictly after last_timestamp.
  [[nodiscard]] std::int64_t wait_next_millis(std::int64_t last_timestamp) const;

  const std::uint64_t component_id_;
  const std::uint64_t node_id_;
  const core::Timestamp start_epoch_;
  const std::int64_t start_epoch_millis_;
  const std::shared_ptr<core::IClock> clock_;

  std::mutex mutex_;
  std::int64_t last_timestamp_{kUninitializedTimestamp};
  std::uint64_t sequence_{0};
};

}  // namespace flakeid::generator
