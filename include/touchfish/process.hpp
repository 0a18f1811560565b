#pragma once
#include <string>
#include <utility>
#include <vector>

namespace touchfish {

struct ProcessResult {
  int exit_code = 0;  // 128 + signal number when the child was killed
  std::string output; // captured stdout (empty unless requested)
};

using EnvOverrides = std::vector<std::pair<std::string, std::string>>;

// fork + execvp `argv[0]` searching PATH. `env` is applied in the child only.
// With `capture_stdout`, the child's stdout is collected and its stderr discarded;
// otherwise the child shares this process's terminal.
// Throws std::runtime_error if the child cannot be started; a failed exec reports 127.
ProcessResult run_process(const std::vector<std::string>& argv, const EnvOverrides& env,
                          bool capture_stdout);

} // namespace touchfish
