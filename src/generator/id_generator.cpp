#include "flakeid/generator/id_generator.h"

#include "flakeid/generator/epoch.h"
#include "flakeid/generator/id_layout.h"

namespace flakeid::generator {

core::Result<std::shared_ptr<IdGenerator>, ConfigError> IdGenerator::create(
    const std::vector<Option>& options) {
  GeneratorConfig config;
  for (const auto& option : options) {
    auto applied = option(config);
    if (!applied.has_value()) {
      return core::Result<std::shared_ptr<IdGenerator>, ConfigError>::err(applied.error());
    }
  }

  return core::Result<std::shared_ptr<IdGenerator>, ConfigError>::ok(
      std::shared_ptr<IdGenerator>(new IdGenerator(config)));
}

IdGenerator::IdGenerator(const GeneratorConfig& config)
    : component_id_(config.component_id),
      node_id_(config.node_id),
      start_epoch_(config.start_epoch),
      start_epoch_millis_(core::to_unix_millis(config.start_epoch)),
      clock_(config.clock) {}

core::Result<std::uint64_t, ClockRegressionError> IdGenerator::next_id() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::int64_t timestamp = elapsed_millis();

  if (timestamp < last_timestamp_) {
    return core::Result<std::uint64_t, ClockRegressionError>::err(
        ClockRegressionError{last_timestamp_ - timestamp});
  }

  if (timestamp == last_timestamp_) {
    // Same millisecond bucket: advance the sequence. When all 2^15 values are used, hold the
    // lock and wait for the next millisecond; emitting now would repeat an ID.
    sequence_ = (sequence_ + 1) & kSequenceMask;
    if (sequence_ == 0) {
      timestamp = wait_next_millis(last_timestamp_);
    }
  } else {
    sequence_ = 0;
  }

  last_timestamp_ = timestamp;
  return core::Result<std::uint64_t, ClockRegressionError>::ok(
      compose_id(timestamp, node_id_, component_id_, sequence_));
}

core::Result<std::string, ClockRegressionError> IdGenerator::next_id_string() {
  auto id = next_id();
  if (!id.has_value()) {
    return core::Result<std::string, ClockRegressionError>::err(id.error());
  }
  return core::Result<std::string, ClockRegressionError>::ok(std::to_string(id.value()));
}

std::uint64_t IdGenerator::next_valid_id() {
  for (;;) {
    auto id = next_id();
    if (id.has_value()) {
      return id.value();
    }
  }
}

std::string IdGenerator::next_valid_id_string() {
  return std::to_string(next_valid_id());
}

core::MillisTimestamp IdGenerator::epoch_validity() const {
  return generator::epoch_validity(start_epoch_);
}

std::int64_t IdGenerator::elapsed_millis() const {
  return core::to_unix_millis(clock_->now()) - start_epoch_millis_;
}

std::int64_t IdGenerator::wait_next_millis(const std::int64_t last_timestamp) const {
  std::int64_t timestamp = elapsed_millis();
  while (timestamp <= last_timestamp) {
    timestamp = elapsed_millis();
  }
  return timestamp;
}

}  // namespace flakeid::generator
