#pragma once

#include "flakeid/core/time.h"

#include <cstdint>
#include <ostream>
#include <string>

// execute_decode writes the fields of id (timestamp, node, component, sequence) and the instant
// it was minted, interpreting the timestamp field relative to start_epoch.
// Returns the process exit code.
int execute_decode(std::uint64_t id, flakeid::core::Timestamp start_epoch,
                   const std::string& format, std::ostream& out);

// execute_validity writes the epoch validity horizon for start_epoch.
// Returns the process exit code.
int execute_validity(flakeid::core::Timestamp start_epoch, const std::string& format,
                     std::ostream& out);
