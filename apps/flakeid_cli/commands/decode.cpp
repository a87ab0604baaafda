#include "decode.h"

#include "decode_logic.h"

#include "flakeid/core/time.h"
#include "flakeid/generator/epoch.h"

#include "shared/arg_parser.h"
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace {

struct DecodeCliConfig {
  std::optional<flakeid::core::Timestamp> start_epoch;
  std::string format{"text"};
  bool args_valid{true};
};

std::vector<flakeid::apps::Option<DecodeCliConfig>> build_options() {
  return {
      {"--start-epoch", true, "Start epoch the IDs were minted against (default 2017-01-01)",
       [](DecodeCliConfig& c, const std::string& v) {
         const auto epoch = flakeid::core::parse_iso8601_utc(v);
         if (!epoch.has_value() || !flakeid::generator::is_valid_start_epoch(epoch.value())) {
           std::cerr << "Invalid --start-epoch: " << v
                     << " (valid: YYYY-MM-DD or YYYY-MM-DDTHH:MM:SSZ between 1970-01-01 and "
                        "2262-01-01)\n";
           return false;
         }
         c.start_epoch = epoch;
         return true;
       }},
      {"--format", true, "Output format (text|json)",
       [](DecodeCliConfig& c, const std::string& v) {
         if (v == "text" || v == "json") {
           c.format = v;
           return true;
         }
         std::cerr << "Invalid --format: " << v << " (valid: text, json)\n";
         return false;
       }},
  };
}

}  // namespace

int cmd_decode(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  if (argc < 3) {
    std::cerr << "Usage: flakeid_cli decode <id> [--start-epoch <date>] [--format <text|json>]\n";
    return 1;
  }

  const std::string id_str = argv[2];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
  const auto id = flakeid::apps::parse_uint64(id_str);
  if (!id.has_value()) {
    std::cerr << "Invalid ID: " << id_str << " (expected an unsigned 64-bit decimal)\n";
    return 1;
  }

  auto config = flakeid::apps::parse_options(argc, argv, build_options(), 3);
  if (!config.args_valid) {
    return 1;
  }

  return execute_decode(id.value(),
                        config.start_epoch.value_or(flakeid::generator::default_start_epoch()),
                        config.format, std::cout);
}

int cmd_validity(int argc, char* argv[]) {  // NOLINT(modernize-avoid-c-arrays)
  auto config = flakeid::apps::parse_options(argc, argv, build_options(), 2);
  if (!config.args_valid) {
    return 1;
  }

  return execute_validity(config.start_epoch.value_or(flakeid::generator::default_start_epoch()),
                          config.format, std::cout);
}
