#pragma once

// cmd_generate: mint IDs from a freshly configured generator and print them.
// Usage: flakeid_cli generate [--component-id <0-31>] [--node-id <0-3>]
//                             [--start-epoch <date>] [--count <n>]
//                             [--format <text|json>] [--strict]
int cmd_generate(int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)
