#pragma once

#include "flakeid/generator/id_generator.h"

#include <cstddef>
#include <ostream>
#include <string>

// GenerateRequest holds the already-validated parameters of a generate run.
struct GenerateRequest {
  std::size_t count{1};        // NOLINT(readability-identifier-naming)
  bool strict{false};          // NOLINT(readability-identifier-naming)
  std::string format{"text"};  // NOLINT(readability-identifier-naming)
};

// execute_generate mints request.count IDs from generator and writes them to out.
// Non-strict runs use next_valid_id_string and wait out clock regressions; strict runs use
// next_id_string and stop at the first regression, reporting it to stderr.
// Returns the process exit code.
int execute_generate(flakeid::generator::IdGenerator& generator, const GenerateRequest& request,
                     std::ostream& out);
