#include "touchfish/refs.hpp"

#include "touchfish/consts.hpp"
#include "touchfish/fs.hpp"
#include "touchfish/util.hpp"

#include <sstream>
#include <stdexcept>

namespace touchfish {

namespace {

// Symbolic refs may chain (HEAD -> refs/heads/x -> ...); git caps the depth at 5.
constexpr int kMaxSymrefDepth = 5;

std::optional<std::string> read_packed_ref(const std::filesystem::path &dir,
                                           const std::string &refname) {
  const auto packed = dir / consts::kPackedRefs;
  if (!fs::exists(packed))
    return std::nullopt;

  std::istringstream iss(fs::read_text(packed));
  std::string line;
  while (std::getline(iss, line)) {
    strutil::rstrip_newlines(line);
    // "# pack-refs with: ..." header and "^<oid>" peeled lines
    if (line.empty() || line[0] == '#' || line[0] == '^')
      continue;
    const auto sp = line.find(consts::kSpace);
    if (sp == std::string::npos)
      continue;
    if (line.compare(sp + 1, std::string::npos, refname) == 0) {
      std::string hex = line.substr(0, sp);
      if (looks_object_id(hex))
        return hex;
    }
  }
  return std::nullopt;
}

std::optional<std::string> resolve_symbolic(const std::filesystem::path &git_dir,
                                            std::string content, int depth) {
  strutil::rstrip_newlines(content);
  if (content.rfind(consts::kRefPrefix, 0) != 0) {
    if (!looks_object_id(content))
      throw std::runtime_error("refs: malformed ref content: " + content);
    return content;
  }
  if (depth >= kMaxSymrefDepth)
    throw std::runtime_error("refs: symbolic ref loop at " + content);
  const std::string target = strutil::trim(content.substr(consts::kRefPrefix.size()));

  const auto dir = common_dir(git_dir);
  const auto loose = dir / target;
  if (fs::exists(loose))
    return resolve_symbolic(git_dir, fs::read_text(loose), depth + 1);
  return read_packed_ref(dir, target);
}

} // namespace

std::optional<std::filesystem::path> find_git_dir(const std::filesystem::path &start) {
  std::error_code ec;
  auto dir = std::filesystem::absolute(start, ec);
  if (ec)
    return std::nullopt;

  for (;;) {
    const auto candidate = dir / consts::kGitDir;
    if (std::filesystem::is_directory(candidate, ec))
      return candidate;
    if (std::filesystem::is_regular_file(candidate, ec)) {
      std::string text = fs::read_text(candidate);
      strutil::rstrip_newlines(text);
      if (text.rfind(consts::kGitdirPrefix, 0) != 0)
        throw std::runtime_error("refs: unrecognized .git file: " + candidate.string());
      std::filesystem::path target = strutil::trim(text.substr(consts::kGitdirPrefix.size()));
      if (target.is_relative())
        target = dir / target;
      return target.lexically_normal();
    }
    if (!dir.has_parent_path() || dir.parent_path() == dir)
      return std::nullopt;
    dir = dir.parent_path();
  }
}

std::filesystem::path common_dir(const std::filesystem::path &git_dir) {
  const auto marker = git_dir / "commondir";
  if (!fs::exists(marker))
    return git_dir;
  std::filesystem::path target = strutil::trim(fs::read_text(marker));
  if (target.is_relative())
    target = git_dir / target;
  return target.lexically_normal();
}

std::optional<std::string> read_HEAD(const std::filesystem::path &git_dir) {
  const auto head = git_dir / consts::kHeadFile;
  if (!fs::exists(head)) {
    return std::nullopt;
  }
  return fs::read_text(head);
}

std::optional<std::string> resolve_HEAD(const std::filesystem::path &git_dir) {
  auto head = read_HEAD(git_dir);
  if (!head)
    return std::nullopt;
  return resolve_symbolic(git_dir, *head, 0);
}

} // namespace touchfish
