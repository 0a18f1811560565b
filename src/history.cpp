#include "touchfish/history.hpp"

#include "touchfish/consts.hpp"
#include "touchfish/error.hpp"
#include "touchfish/object_store.hpp"
#include "touchfish/process.hpp"
#include "touchfish/refs.hpp"
#include "touchfish/util.hpp"

#include <charconv>
#include <exception>
#include <stdexcept>

namespace touchfish {

namespace {

std::time_t parse_epoch(std::string_view digits) {
  long long v = 0;
  const auto *first = digits.data();
  const auto *last = digits.data() + digits.size();
  const auto [ptr, ec] = std::from_chars(first, last, v);
  if (digits.empty() || ec != std::errc{} || ptr != last)
    throw std::runtime_error("bad timestamp '" + std::string(digits) + "'");
  return static_cast<std::time_t>(v);
}

} // namespace

std::time_t parse_committer_time(std::string_view payload) {
  // Headers end at the first empty line
  while (!payload.empty() && payload.front() != consts::kLF) {
    const auto nl = payload.find(consts::kLF);
    const std::string_view line = payload.substr(0, nl);
    if (line.rfind(consts::kCommitterPrefix, 0) == 0) {
      // "committer Name <email> 1714412345 +0300"
      const auto close = line.rfind('>');
      if (close == std::string_view::npos)
        break;
      const std::string rest = strutil::trim(line.substr(close + 1));
      const auto sp = rest.find(consts::kSpace);
      return parse_epoch(std::string_view(rest).substr(0, sp));
    }
    if (nl == std::string_view::npos)
      break;
    payload.remove_prefix(nl + 1);
  }
  throw std::runtime_error("commit has no committer line");
}

std::optional<std::time_t> HistoryReader::query() const {
  std::optional<std::filesystem::path> git_dir;
  try {
    git_dir = find_git_dir(work_dir_);
  } catch (const std::exception &e) {
    throw Error(errc::repository_query_failure, std::string("cannot locate .git: ") + e.what());
  }
  if (!git_dir)
    throw Error(errc::repository_query_failure, "not a git repository: " + work_dir_.string());

  std::string native_error;
  try {
    const auto head = resolve_HEAD(*git_dir);
    if (!head)
      return std::nullopt;
    if (auto t = read_loose_commit(common_dir(*git_dir), *head))
      return t;
  } catch (const std::exception &e) {
    native_error = e.what();
  }

  // Packed commit, SHA-256 repository or a layout we do not parse: let git answer.
  try {
    return ask_git();
  } catch (const std::exception &e) {
    std::string msg = std::string("cannot read HEAD: ") + e.what();
    if (!native_error.empty())
      msg += " (" + native_error + ")";
    throw Error(errc::repository_query_failure, msg);
  }
}

std::optional<std::time_t> HistoryReader::last_commit_time() const {
  try {
    return query();
  } catch (const Error &) {
    // Treated as a repository without history.
    return std::nullopt;
  }
}

std::optional<std::time_t> HistoryReader::read_loose_commit(const std::filesystem::path &dir,
                                                            const std::string &hex_oid) {
  const ObjectStore store{dir};
  if (!store.has_loose(hex_oid))
    return std::nullopt;

  const Object obj = store.read(hex_oid);
  if (obj.type != consts::kTypeCommit)
    throw std::runtime_error("HEAD is a " + obj.type + ", not a commit");
  return parse_committer_time(
      std::string_view(reinterpret_cast<const char *>(obj.data.data()), obj.data.size()));
}

std::time_t HistoryReader::ask_git() const {
  const ProcessResult r = run_process(
      {git_, "-C", work_dir_.string(), "log", "-1", "--format=%ct"}, {}, /*capture_stdout=*/true);
  if (r.exit_code != 0)
    throw Error(errc::repository_query_failure,
                "git log exited with status " + std::to_string(r.exit_code));
  return parse_epoch(strutil::trim(r.output));
}

} // namespace touchfish
