// Small string/environment helpers shared by the config, refs and runner code
#include "touchfish/util.hpp"

#include "touchfish/consts.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <stdexcept>

namespace touchfish {

bool looks_object_id(std::string_view str) {
  if (str.size() != consts::kOidHexLen && str.size() != consts::kOidHexLenSha256) {
    return false;
  }
  return std::ranges::all_of(str,
                             [](char c) { return std::isxdigit(static_cast<unsigned char>(c)); });
}

std::optional<std::string> env_value(std::string_view name) {
  const char *v = std::getenv(std::string(name).c_str());
  if (v == nullptr || *v == '\0')
    return std::nullopt;
  return std::string(v);
}

std::filesystem::path xdg_config_home() {
  if (auto xdg = env_value("XDG_CONFIG_HOME"))
    return std::filesystem::path(*xdg);
  if (auto home = env_value("HOME"))
    return std::filesystem::path(*home) / ".config";
  throw std::runtime_error("neither XDG_CONFIG_HOME nor HOME is set");
}

namespace strutil {

void rstrip_newlines(std::string &s) {
  while (!s.empty()) {
    char c = s.back();
    if (c == '\n' || c == '\r') {
      s.pop_back();
    } else {
      break;
    }
  }
}

std::string trim(std::string_view sv) {
  auto blank = [](char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; };
  while (!sv.empty() && blank(sv.front()))
    sv.remove_prefix(1);
  while (!sv.empty() && blank(sv.back()))
    sv.remove_suffix(1);
  return std::string(sv);
}

} // namespace strutil

} // namespace touchfish
