#include "flakeid/generator/errors.h"

namespace flakeid::generator {

std::string ClockRegressionError::message() const {
  return "clock moved backwards, refusing to generate IDs for " + std::to_string(regression_ms) +
         " ms";
}

std::string config_error_code_to_string(const ConfigErrorCode code) {
  switch (code) {
    case ConfigErrorCode::kInvalidComponentId:
      return "invalid_component_id";
    case ConfigErrorCode::kInvalidNodeId:
      return "invalid_node_id";
    case ConfigErrorCode::kInvalidStartEpoch:
      return "invalid_start_epoch";
    case ConfigErrorCode::kMissingClock:
      return "missing_clock";
  }
  return "unknown";
}

}  // namespace flakeid::generator
