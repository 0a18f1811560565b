#include "cli/registry.hpp"

int cmd_set(int argc, char **argv);
int cmd_show(int argc, char **argv);
int cmd_amend(int argc, char **argv);
int cmd_commit(int argc, char **argv);

namespace touchfish::cli {

void register_all_commands() {
  register_command("set", ::cmd_set,
                   "Set the daily time window: git-tc set <start> <end> (HH:MM, 24-hour)");
  register_command("show", ::cmd_show, "Show the configured time window");
  register_command("amend", ::cmd_amend,
                   "Amend the last commit with a new random time: git-tc amend [git args...]");
  set_default_command(::cmd_commit,
                      "Commit with a random time in the window; all args go to `git commit`");
}

} // namespace touchfish::cli
