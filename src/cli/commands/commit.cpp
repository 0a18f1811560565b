#include "cli/scheduled_commit.hpp"

#include <string>
#include <vector>

// Default command: argv[0] is the program name, the rest goes to `git commit` untouched.
int cmd_commit(int argc, char **argv) {
  touchfish::CommitOptions options;
  options.extra_args.assign(argv + 1, argv + argc);
  return touchfish::cli::run_scheduled_commit("commit", options);
}
