#pragma once

#include "flakeid/core/clock.h"
#include "flakeid/core/result.h"
#include "flakeid/core/time.h"
#include "flakeid/generator/errors.h"

#include <cstdint>
#include <functional>
#include <memory>

namespace flakeid::generator {

// GeneratorConfig is the draft state options mutate before an IdGenerator is frozen from it.
// A default-constructed config describes component 0, node 0, the default start epoch and the
// system wall clock.
struct GeneratorConfig {
  std::uint64_t component_id{0};  // NOLINT(readability-identifier-naming)
  std::uint64_t node_id{0};       // NOLINT(readability-identifier-naming)
  core::Timestamp start_epoch;    // NOLINT(readability-identifier-naming)
  std::shared_ptr<core::IClock> clock;  // NOLINT(readability-identifier-naming)

  GeneratorConfig();
};

// Option validates its argument and applies it to the draft config.
// Returns ok(true) when applied, err(ConfigError) when rejected (config left untouched).
using Option = std::function<core::Result<bool, ConfigError>(GeneratorConfig&)>;

// with_component_id: id must be in [0, 31].
[[nodiscard]] Option with_component_id(std::uint64_t id);

// with_node_id: id must be in [0, 3].
[[nodiscard]] Option with_node_id(std::uint64_t id);

// with_start_epoch: epoch must be in [1970-01-01Z, 2262-01-01Z].
[[nodiscard]] Option with_start_epoch(core::Timestamp epoch);

// with_clock substitutes the time source, typically for deterministic tests. Must be non-null.
[[nodiscard]] Option with_clock(std::shared_ptr<core::IClock> clock);

}  // namespace flakeid::generator
