#include "touchfish/runner.hpp"

#include "touchfish/consts.hpp"
#include "touchfish/error.hpp"
#include "touchfish/process.hpp"
#include "touchfish/util.hpp"

#include <exception>

namespace touchfish {

std::string git_executable() {
  return env_value(consts::kEnvGit).value_or(std::string(consts::kDefaultGit));
}

std::vector<std::string> commit_argv(const std::string &git, const CommitOptions &options) {
  std::vector<std::string> argv{git, "commit"};
  if (options.amend) {
    argv.emplace_back("--amend");
    argv.emplace_back("--no-edit");
    argv.emplace_back("--reset-author");
  }
  argv.insert(argv.end(), options.extra_args.begin(), options.extra_args.end());
  return argv;
}

void CommitRunner::commit(const GeneratedTimestamp &when, const CommitOptions &options) const {
  const std::string stamp = when.rfc3339();
  const EnvOverrides env{{std::string(consts::kEnvAuthorDate), stamp},
                         {std::string(consts::kEnvCommitterDate), stamp}};
  const std::string what = options.amend ? "git commit --amend" : "git commit";

  ProcessResult result;
  try {
    result = run_process(commit_argv(git_, options), env, /*capture_stdout=*/false);
  } catch (const std::exception &e) {
    throw Error(errc::commit_failed, what + " could not be started: " + e.what());
  }
  if (result.exit_code != 0) {
    throw Error(errc::commit_failed,
                what + " failed (exit status " + std::to_string(result.exit_code) + ")");
  }
}

} // namespace touchfish
