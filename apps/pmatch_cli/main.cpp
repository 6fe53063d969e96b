#include "pmatch/core/version.h"

#include "commands/run.h"
#include "commands/show.h"
#include <iostream>
#include <string>

namespace {

void print_usage() {
  std::cerr << "pmatch_cli (artifact version " << pmatch::core::kArtifactVersion << ")\n"
            << "Usage:\n"
            << "  pmatch_cli run --profiles <file> --records <file> --output <file>\n"
            << "                 [--config <file>] [--mode auto|exact|heuristic] [--workers N]\n"
            << "                 [--db <sqlite>] [--fixed-clock <iso8601>]\n"
            << "  pmatch_cli show --db <sqlite>\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2) {
    print_usage();
    return 1;
  }

  const std::string subcommand = argv[1];
  if (subcommand == "run") {
    return cmd_run(argc, argv);
  }
  if (subcommand == "show") {
    return cmd_show(argc, argv);
  }
  if (subcommand == "--help" || subcommand == "-h") {
    print_usage();
    return 0;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_usage();
  return 1;
}
