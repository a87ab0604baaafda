#include "commands/decode.h"
#include "commands/generate.h"

#include "flakeid/core/version.h"

#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "flakeid_cli v" << flakeid::core::kBuildVersion << "\n"
            << "Usage: flakeid_cli <command> [options]\n"
            << "\n"
            << "Commands:\n"
            << "  generate   Mint IDs (--component-id, --node-id, --start-epoch, --count,\n"
            << "             --format, --strict)\n"
            << "  decode     Split an ID into its fields (<id> --start-epoch, --format)\n"
            << "  validity   Show how long IDs stay unique (--start-epoch, --format)\n"
            << "  version    Print the build version\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "generate") {
    return cmd_generate(argc, argv);
  }
  if (subcommand == "decode") {
    return cmd_decode(argc, argv);
  }
  if (subcommand == "validity") {
    return cmd_validity(argc, argv);
  }
  if (subcommand == "version") {
    std::cout << flakeid::core::kBuildVersion << "\n";
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
