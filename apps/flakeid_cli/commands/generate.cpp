#include "generate.h"

#include "generate_logic.h"

#include "flakeid/core/time.h"
#include "flakeid/generator/id_generator.h"
#include "flakeid/generator/options.h"

#include "shared/arg_parser.h"
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

namespace {

// Upper bound on --count; keeps a typo from buffering millions of IDs.
constexpr std::uint64_t kMaxCount = 1'000'000;

struct GenerateCliConfig {
  std::vector<flakeid::generator::Option> generator_options;
  GenerateRequest request;
  bool args_valid{true};
};

// Generator options are collected in flag order and validated by IdGenerator::create, so the
// first invalid value on the command line is the one reported.
std::vector<flakeid::apps::Option<GenerateCliConfig>> build_options() {
  return {
      {"--component-id", true, "Component ID (0-31)",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto id = flakeid::apps::parse_uint64(v);
         if (!id.has_value()) {
           std::cerr << "Invalid --component-id: " << v << " (expected a non-negative integer)\n";
           return false;
         }
         c.generator_options.push_back(flakeid::generator::with_component_id(id.value()));
         return true;
       }},
      {"--node-id", true, "Node ID (0-3)",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto id = flakeid::apps::parse_uint64(v);
         if (!id.has_value()) {
           std::cerr << "Invalid --node-id: " << v << " (expected a non-negative integer)\n";
           return false;
         }
         c.generator_options.push_back(flakeid::generator::with_node_id(id.value()));
         return true;
       }},
      {"--start-epoch", true, "Start epoch, ISO 8601 UTC (default 2017-01-01)",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto epoch = flakeid::core::parse_iso8601_utc(v);
         if (!epoch.has_value()) {
           std::cerr << "Invalid --start-epoch: " << v
                     << " (valid: YYYY-MM-DD or YYYY-MM-DDTHH:MM:SSZ)\n";
           return false;
         }
         c.generator_options.push_back(flakeid::generator::with_start_epoch(epoch.value()));
         return true;
       }},
      {"--count", true, "Number of IDs to generate (default 1)",
       [](GenerateCliConfig& c, const std::string& v) {
         const auto count = flakeid::apps::parse_uint64(v);
         if (!count.has_value() || count.value() == 0 || count.value() > kMaxCount) {
           std::cerr << "Invalid --count: " << v << " (valid: 1.." << kMaxCount << ")\n";
           return false;
         }
         c.request.count = static_cast<std::size_t>(count.value());
         return true;
       }},
      {"--format", true, "Output format (text|json)",
       [](GenerateCliConfig& c, const std::string& v) {
         if (v == "text" || v == "json") {
           c.request.format = v;
           return true;
         }
         std::cerr << "Invalid --format: " << v << " (valid: text, json)\n";
         return false;
       }},
      {"--strict", false, "Fail on clock regression instead of waiting for the clock to recover",
       [](GenerateCliConfig& c, const std::string&) {
         c.request.strict = true;
         return true;
       }},
  };
}

}  // namespace

int cmd_generate(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto config = flakeid::apps::parse_options(argc, argv, build_options(), 2);

  if (!config.args_valid) {
    return 1;
  }

  auto generator_result = flakeid::generator::IdGenerator::create(config.generator_options);
  if (!generator_result.has_value()) {
    const auto& error = generator_result.error();
    std::cerr << "Invalid generator configuration ("
              << flakeid::generator::config_error_code_to_string(error.code)
              << "): " << error.message << "\n";
    return 1;
  }

  return execute_generate(*generator_result.value(), config.request, std::cout);
}
