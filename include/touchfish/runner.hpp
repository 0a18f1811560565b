#pragma once
#include "touchfish/generator.hpp"

#include <string>
#include <utility>
#include <vector>

namespace touchfish {

struct CommitOptions {
  bool amend = false;                   // --amend --no-edit --reset-author
  std::vector<std::string> extra_args;  // forwarded verbatim after the fixed flags
};

// Executable used for commits and the fallback history query ($TOUCHFISH_GIT or "git").
auto git_executable() -> std::string;

// Full argv for the commit, starting with `git`.
auto commit_argv(const std::string &git, const CommitOptions &options) -> std::vector<std::string>;

class CommitRunner {
public:
  explicit CommitRunner(std::string git = git_executable()) : git_(std::move(git)) {}

  // Runs git with GIT_AUTHOR_DATE and GIT_COMMITTER_DATE set to `when`.
  // Any non-zero exit throws Error(errc::commit_failed).
  void commit(const GeneratedTimestamp &when, const CommitOptions &options) const;

  [[nodiscard]] const std::string &git() const { return git_; }

private:
  std::string git_;
};

} // namespace touchfish
