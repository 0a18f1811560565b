#include "touchfish/error.hpp"
#include "touchfish/generator.hpp"
#include "touchfish/runner.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

// Stand-in for git: records its environment and arguments, exits with $FAKE_GIT_STATUS
static fs::path write_fake_git(const fs::path &dir) {
  const fs::path script = dir / "fake-git";
  std::ofstream(script, std::ios::binary)
      << "#!/bin/sh\n"
         "{\n"
         "  printf 'author=%s\\n' \"$GIT_AUTHOR_DATE\"\n"
         "  printf 'committer=%s\\n' \"$GIT_COMMITTER_DATE\"\n"
         "  for a in \"$@\"; do printf 'arg=%s\\n' \"$a\"; done\n"
         "} > \"$FAKE_GIT_LOG\"\n"
         "exit \"${FAKE_GIT_STATUS:-0}\"\n";
  fs::permissions(script, fs::perms::owner_all, fs::perm_options::add);
  return script;
}

static bool commit_fails(const touchfish::CommitRunner &runner,
                         const touchfish::GeneratedTimestamp &stamp) {
  try {
    runner.commit(stamp, touchfish::CommitOptions{});
  } catch (const touchfish::Error &e) {
    return e.code() == touchfish::errc::commit_failed;
  }
  return false;
}

int main() {
  ::setenv("TZ", "CST-8", 1);
  ::tzset();

  const fs::path root =
      fs::temp_directory_path() / ("touchfish_runner_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    // 1) argv layout
    {
      const auto plain = touchfish::commit_argv("git", {.amend = false, .extra_args = {"-m", "a b"}});
      if (plain != std::vector<std::string>{"git", "commit", "-m", "a b"}) {
        std::cerr << "plain commit argv wrong\n";
        return 1;
      }
      const auto amend = touchfish::commit_argv("git", {.amend = true, .extra_args = {"-S"}});
      if (amend != std::vector<std::string>{"git", "commit", "--amend", "--no-edit",
                                            "--reset-author", "-S"}) {
        std::cerr << "amend argv wrong\n";
        return 1;
      }
    }

    // 2) Environment and arguments reach the child untouched
    const fs::path fake = write_fake_git(root);
    const fs::path log = root / "git.log";
    ::setenv("FAKE_GIT_LOG", log.c_str(), 1);
    // 2024-01-02T09:15:00+08:00
    const touchfish::GeneratedTimestamp stamp{.when = 1704158100, .utc_offset_minutes = 480};
    {
      touchfish::CommitRunner runner{fake.string()};
      runner.commit(stamp, {.amend = true, .extra_args = {"--message", "with  spaces", "-q"}});
      const std::string expected = "author=2024-01-02T09:15:00+08:00\n"
                                   "committer=2024-01-02T09:15:00+08:00\n"
                                   "arg=commit\n"
                                   "arg=--amend\n"
                                   "arg=--no-edit\n"
                                   "arg=--reset-author\n"
                                   "arg=--message\n"
                                   "arg=with  spaces\n"
                                   "arg=-q\n";
      if (slurp(log) != expected) {
        std::cerr << "child saw:\n" << slurp(log);
        return 1;
      }
    }

    // 3) Non-zero exit becomes CommitFailed, with the status in the message
    ::setenv("FAKE_GIT_STATUS", "3", 1);
    {
      touchfish::CommitRunner runner{fake.string()};
      try {
        runner.commit(stamp, {});
        std::cerr << "failing git reported success\n";
        return 1;
      } catch (const touchfish::Error &e) {
        if (e.code() != touchfish::errc::commit_failed ||
            std::string(e.what()).find("exit status 3") == std::string::npos) {
          std::cerr << "unexpected failure report: " << e.what() << "\n";
          return 1;
        }
      }
    }
    ::unsetenv("FAKE_GIT_STATUS");

    // 4) Missing executable is a failed commit too
    if (!commit_fails(touchfish::CommitRunner{(root / "no-such-git").string()}, stamp)) {
      std::cerr << "missing git not reported as commit_failed\n";
      return 1;
    }

    // 5) TOUCHFISH_GIT selects the executable
    ::setenv("TOUCHFISH_GIT", fake.c_str(), 1);
    if (touchfish::git_executable() != fake.string() ||
        touchfish::CommitRunner{}.git() != fake.string()) {
      std::cerr << "TOUCHFISH_GIT ignored\n";
      return 1;
    }
    ::unsetenv("TOUCHFISH_GIT");
    if (touchfish::git_executable() != "git") {
      std::cerr << "default executable is not git\n";
      return 1;
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
