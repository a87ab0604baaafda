#pragma once

// cmd_decode: split an ID into its embedded fields.
// Usage: flakeid_cli decode <id> [--start-epoch <date>] [--format <text|json>]
int cmd_decode(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// cmd_validity: print the last instant IDs minted against an epoch stay unique.
// Usage: flakeid_cli validity [--start-epoch <date>] [--format <text|json>]
int cmd_validity(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
