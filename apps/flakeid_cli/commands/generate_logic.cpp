#include "generate_logic.h"

#include "flakeid/core/time.h"

#include <nlohmann/json.hpp>

#include <iostream>
#include <vector>

int execute_generate(flakeid::generator::IdGenerator& generator, const GenerateRequest& request,
                     std::ostream& out) {
  std::vector<std::string> ids;
  ids.reserve(request.count);

  for (std::size_t i = 0; i < request.count; ++i) {
    if (!request.strict) {
      ids.push_back(generator.next_valid_id_string());
      continue;
    }

    auto id = generator.next_id_string();
    if (!id.has_value()) {
      std::cerr << "Error: " << id.error().message() << " (after " << ids.size()
                << " IDs)\n";
      return 1;
    }
    ids.push_back(id.value());
  }

  if (request.format == "json") {
    nlohmann::json doc;
    doc["component_id"] = generator.component_id();
    doc["node_id"] = generator.node_id();
    doc["start_epoch"] = flakeid::core::format_iso8601_utc(generator.start_epoch());
    doc["epoch_validity"] = flakeid::core::format_iso8601_utc(generator.epoch_validity());
    doc["ids"] = ids;
    out << doc.dump(2) << "\n";
    return 0;
  }

  for (const auto& id : ids) {
    out << id << "\n";
  }
  return 0;
}
