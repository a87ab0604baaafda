#pragma once

#include <compare>
#include <cstdint>

namespace flakeid::generator {

// Bit layout of a 64-bit ID, most to least significant:
//
//   [ 42-bit elapsed ms ][ 2-bit node ][ 5-bit component ][ 15-bit sequence ]
//   63               22  21        20  19             15  14              0
//
// Downstream systems rely on these widths and offsets to extract the embedded fields.
inline constexpr unsigned kComponentIdBits = 5;
inline constexpr unsigned kNodeIdBits = 2;
inline constexpr unsigned kSequenceBits = 15;
inline constexpr unsigned kTimestampBits = 64 - kComponentIdBits - kNodeIdBits - kSequenceBits;

inline constexpr unsigned kComponentIdShift = kSequenceBits;
inline constexpr unsigned kNodeIdShift = kSequenceBits + kComponentIdBits;
inline constexpr unsigned kTimestampShift = kSequenceBits + kComponentIdBits + kNodeIdBits;

inline constexpr std::uint64_t kMaxComponentId = (std::uint64_t{1} << kComponentIdBits) - 1;
inline constexpr std::uint64_t kMaxNodeId = (std::uint64_t{1} << kNodeIdBits) - 1;
inline constexpr std::uint64_t kSequenceMask = (std::uint64_t{1} << kSequenceBits) - 1;
inline constexpr std::int64_t kMaxTimestampMillis = (std::int64_t{1} << kTimestampBits) - 1;

// IdFields is the decoded form of an ID. timestamp_ms is relative to the generator's start epoch.
struct IdFields {
  std::int64_t timestamp_ms{0};   // NOLINT(readability-identifier-naming)
  std::uint64_t node_id{0};       // NOLINT(readability-identifier-naming)
  std::uint64_t component_id{0};  // NOLINT(readability-identifier-naming)
  std::uint64_t sequence{0};      // NOLINT(readability-identifier-naming)
  auto operator<=>(const IdFields&) const = default;
};

// compose_id packs the fields. Bits of timestamp_ms above kTimestampBits are shifted out;
// callers are responsible for staying inside the epoch validity horizon.
constexpr std::uint64_t compose_id(const std::int64_t timestamp_ms, const std::uint64_t node_id,
                                   const std::uint64_t component_id,
                                   const std::uint64_t sequence) {
  return (static_cast<std::uint64_t>(timestamp_ms) << kTimestampShift) |
         ((node_id & kMaxNodeId) << kNodeIdShift) |
         ((component_id & kMaxComponentId) << kComponentIdShift) | (sequence & kSequenceMask);
}

constexpr IdFields decode_id(const std::uint64_t id) {
  return IdFields{
      .timestamp_ms = static_cast<std::int64_t>(id >> kTimestampShift),
      .node_id = (id >> kNodeIdShift) & kMaxNodeId,
      .component_id = (id >> kComponentIdShift) & kMaxComponentId,
      .sequence = id & kSequenceMask,
  };
}

}  // namespace flakeid::generator
