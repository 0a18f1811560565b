#include "cli/registry.hpp"

#include <iostream>
#include <string>

int main(int argc, char **argv) {
  touchfish::cli::register_all_commands(); // defined in register_commands.cpp

  if (argc < 2) {
    touchfish::cli::print_usage(std::cout);
    return 0;
  }
  const std::string cmd = argv[1];

  if (const auto fn = touchfish::cli::find_command(cmd)) {
    // Pass everything after the subcommand to the handler
    return fn(argc - 1, argv + 1);
  }
  // Not a subcommand: every argument belongs to `git commit`
  return touchfish::cli::default_command()(argc, argv);
}
