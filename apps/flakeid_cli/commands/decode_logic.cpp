#include "decode_logic.h"

#include "flakeid/generator/epoch.h"
#include "flakeid/generator/id_layout.h"

#include <nlohmann/json.hpp>

int execute_decode(const std::uint64_t id, const flakeid::core::Timestamp start_epoch,
                   const std::string& format, std::ostream& out) {
  const auto fields = flakeid::generator::decode_id(id);
  const std::string minted_at =
      flakeid::core::format_iso8601_utc(flakeid::generator::id_timestamp(id, start_epoch));

  if (format == "json") {
    nlohmann::json doc;
    doc["id"] = std::to_string(id);
    doc["timestamp_ms"] = fields.timestamp_ms;
    doc["node_id"] = fields.node_id;
    doc["component_id"] = fields.component_id;
    doc["sequence"] = fields.sequence;
    doc["start_epoch"] = flakeid::core::format_iso8601_utc(start_epoch);
    doc["minted_at"] = minted_at;
    out << doc.dump(2) << "\n";
    return 0;
  }

  out << "ID: " << id << "\n";
  out << "  Timestamp (ms since epoch): " << fields.timestamp_ms << "\n";
  out << "  Node ID: " << fields.node_id << "\n";
  out << "  Component ID: " << fields.component_id << "\n";
  out << "  Sequence: " << fields.sequence << "\n";
  out << "  Start epoch: " << flakeid::core::format_iso8601_utc(start_epoch) << "\n";
  out << "  Minted at: " << minted_at << "\n";
  return 0;
}

int execute_validity(const flakeid::core::Timestamp start_epoch, const std::string& format,
                     std::ostream& out) {
  const std::string epoch = flakeid::core::format_iso8601_utc(start_epoch);
  const std::string valid_until =
      flakeid::core::format_iso8601_utc(flakeid::generator::epoch_validity(start_epoch));

  if (format == "json") {
    nlohmann::json doc;
    doc["start_epoch"] = epoch;
    doc["epoch_validity"] = valid_until;
    out << doc.dump(2) << "\n";
    return 0;
  }

  out << "Start epoch: " << epoch << "\n";
  out << "IDs unique until: " << valid_until << "\n";
  return 0;
}
