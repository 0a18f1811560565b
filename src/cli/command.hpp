#pragma once

namespace touchfish::cli {

// argv[0] is the subcommand name (or the program name for the default command)
using command_fn = int (*)(int argc, char **argv);

} // namespace touchfish::cli
