#include "cli/scheduled_commit.hpp"

#include <string>
#include <vector>

int cmd_amend(int argc, char **argv) {
  touchfish::CommitOptions options{.amend = true,
                                   .extra_args = std::vector<std::string>(argv + 1, argv + argc)};
  return touchfish::cli::run_scheduled_commit("amend", options);
}
