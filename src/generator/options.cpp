#include "flakeid/generator/options.h"

#include "flakeid/generator/epoch.h"
#include "flakeid/generator/id_layout.h"

#include <string>
#include <utility>

namespace flakeid::generator {

namespace {

using OptionResult = core::Result<bool, ConfigError>;

OptionResult reject(const ConfigErrorCode code, std::string message) {
  return OptionResult::err(ConfigError{code, std::move(message)});
}

}  // namespace

GeneratorConfig::GeneratorConfig()
    : start_epoch(default_start_epoch()), clock(std::make_shared<core::SystemClock>()) {}

Option with_component_id(const std::uint64_t id) {
  return [id](GeneratorConfig& config) {
    if (id > kMaxComponentId) {
      return reject(ConfigErrorCode::kInvalidComponentId,
                    "the component id must be in [0.." + std::to_string(kMaxComponentId) +
                        "], got " + std::to_string(id));
    }
    config.component_id = id;
    return OptionResult::ok(true);
  };
}

Option with_node_id(const std::uint64_t id) {
  return [id](GeneratorConfig& config) {
    if (id > kMaxNodeId) {
      return reject(ConfigErrorCode::kInvalidNodeId, "the node id must be in [0.." +
                                                         std::to_string(kMaxNodeId) + "], got " +
                                                         std::to_string(id));
    }
    config.node_id = id;
    return OptionResult::ok(true);
  };
}

Option with_start_epoch(const core::Timestamp epoch) {
  return [epoch](GeneratorConfig& config) {
    if (!is_valid_start_epoch(epoch)) {
      return reject(ConfigErrorCode::kInvalidStartEpoch,
                    "the start epoch must be between " +
                        core::format_iso8601_utc(min_start_epoch()) + " and " +
                        core::format_iso8601_utc(max_start_epoch()) + ", got " +
                        core::format_iso8601_utc(epoch));
    }
    config.start_epoch = epoch;
    return OptionResult::ok(true);
  };
}

Option with_clock(std::shared_ptr<core::IClock> clock) {
  return [clock = std::move(clock)](GeneratorConfig& config) {
    if (clock == nullptr) {
      return reject(ConfigErrorCode::kMissingClock, "the clock source must not be null");
    }
    config.clock = clock;
    return OptionResult::ok(true);
  };
}

}  // namespace flakeid::generator
