#pragma once
#include <ctime>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace touchfish {

// Committer timestamp (seconds since the epoch) from a raw commit object payload.
// Throws std::runtime_error when the header has no well-formed committer line.
auto parse_committer_time(std::string_view commit_payload) -> std::time_t;

/**
 * Reads the commit time of HEAD for the repository containing `work_dir`.
 *
 * Loose commits are read straight from .git/objects. When HEAD names a packed
 * commit, or the refs and objects cannot be read natively (SHA-256 repositories,
 * unexpected layouts), `git log -1 --format=%ct` is asked instead.
 */
class HistoryReader {
public:
  explicit HistoryReader(std::filesystem::path work_dir, std::string git = "git")
      : work_dir_(std::move(work_dir)), git_(std::move(git)) {}

  // Never throws: no repository, an unborn branch and any read failure all give std::nullopt.
  [[nodiscard]] auto last_commit_time() const -> std::optional<std::time_t>;

  // Same lookup, but a failure throws Error(errc::repository_query_failure).
  // std::nullopt only for a repository without commits.
  [[nodiscard]] auto query() const -> std::optional<std::time_t>;

private:
  // Committer time of a loose commit under `dir`/objects; std::nullopt if not stored loose.
  [[nodiscard]] static auto read_loose_commit(const std::filesystem::path &dir,
                                              const std::string &hex_oid)
      -> std::optional<std::time_t>;
  [[nodiscard]] auto ask_git() const -> std::time_t;

  std::filesystem::path work_dir_;
  std::string git_;
};

} // namespace touchfish
