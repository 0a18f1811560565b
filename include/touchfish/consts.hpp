#pragma once
#include <cstdint>
#include <string_view>

namespace touchfish::consts {

// Application identity
inline constexpr std::string_view kProgramName = "git-tc";
inline constexpr std::string_view kAppName     = "git-touchfish-commit";
inline constexpr std::string_view kConfigFile  = "config";

// Default window when nothing is stored
inline constexpr std::string_view kDefaultStart = "00:00";
inline constexpr std::string_view kDefaultEnd   = "02:00";

// Config keys
inline constexpr std::string_view kStartKey = "start_time";
inline constexpr std::string_view kEndKey   = "end_time";

// Environment
inline constexpr std::string_view kEnvConfig       = "TOUCHFISH_CONFIG";
inline constexpr std::string_view kEnvGit          = "TOUCHFISH_GIT";
inline constexpr std::string_view kEnvAuthorDate   = "GIT_AUTHOR_DATE";
inline constexpr std::string_view kEnvCommitterDate = "GIT_COMMITTER_DATE";
inline constexpr std::string_view kDefaultGit      = "git";

// Git repository layout
inline constexpr std::string_view kGitDir        = ".git";
inline constexpr std::string_view kObjectsDir    = "objects";
inline constexpr std::string_view kHeadFile      = "HEAD";
inline constexpr std::string_view kPackedRefs    = "packed-refs";
inline constexpr std::string_view kGitdirPrefix  = "gitdir: ";
inline constexpr std::string_view kTypeCommit    = "commit";

// ——— Object ID sizes ———
inline constexpr std::size_t kOidRawLen = 20;  // 20 bytes (SHA-1)
inline constexpr std::size_t kOidHexLen = 40;  // 40 hex chars (SHA-1)
inline constexpr std::size_t kOidHexLenSha256 = 64; // repositories using --object-format=sha256

// ——— Object store fanout ———
inline constexpr std::size_t kFanoutDirHexLen = 2; // "aa/" + "bbbb..." in .git/objects

// ——— Commit header prefixes ———
inline constexpr std::string_view kRefPrefix       = "ref: ";
inline constexpr std::string_view kCommitterPrefix = "committer ";

// ——— Common characters ———
inline constexpr char kSpace = ' ';
inline constexpr char kLF    = '\n';

// ——— Calendar ———
inline constexpr int kMinutesPerHour = 60;
inline constexpr int kHoursPerDay    = 24;

} // namespace touchfish::consts
