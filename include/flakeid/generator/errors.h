#pragma once

#include <cstdint>
#include <string>

namespace flakeid::generator {

// Error types following E.14 (use purpose-designed types as error indicators).

enum class ConfigErrorCode {
  kInvalidComponentId,  // NOLINT(readability-identifier-naming)
  kInvalidNodeId,       // NOLINT(readability-identifier-naming)
  kInvalidStartEpoch,   // NOLINT(readability-identifier-naming)
  kMissingClock,        // NOLINT(readability-identifier-naming)
};

// ConfigError is returned when a construction option is rejected. No generator is produced.
struct ConfigError {
  ConfigErrorCode code;  // NOLINT(readability-identifier-naming)
  std::string message;   // NOLINT(readability-identifier-naming)
};

// ClockRegressionError is returned by next_id when the clock reads earlier than the last
// emission. The generator state is untouched; retrying once the clock catches up succeeds.
struct ClockRegressionError {
  std::int64_t regression_ms{0};  // NOLINT(readability-identifier-naming)

  [[nodiscard]] std::string message() const;
};

[[nodiscard]] std::string config_error_code_to_string(ConfigErrorCode code);

}  // namespace flakeid::generator
