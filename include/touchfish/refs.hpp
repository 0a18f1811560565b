#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace touchfish {

// Walk up from `start` looking for ".git". Follows "gitdir: <path>" files
// (worktrees, submodules). Returns the git directory itself.
std::optional<std::filesystem::path> find_git_dir(const std::filesystem::path& start);

// Directory holding refs/ and objects/. Differs from `git_dir` for linked worktrees.
std::filesystem::path common_dir(const std::filesystem::path& git_dir);

// Read HEAD file as raw string (e.g., "ref: refs/heads/main\n" or a hex id).
// Returns std::nullopt if HEAD does not exist.
std::optional<std::string> read_HEAD(const std::filesystem::path& git_dir);

// Commit id HEAD points at (40 or 64 hex), following symbolic refs through the loose
// ref files, then packed-refs. std::nullopt for an unborn branch.
std::optional<std::string> resolve_HEAD(const std::filesystem::path& git_dir);

} // namespace touchfish
