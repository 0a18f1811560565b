#pragma once
#include "touchfish/runner.hpp"

#include <string_view>

namespace touchfish::cli {

// Load the window, read HEAD's time, pick a timestamp and run git with it.
// `name` prefixes error messages ("amend: ..."). Returns the process exit code.
int run_scheduled_commit(std::string_view name, const CommitOptions &options);

} // namespace touchfish::cli
