#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace touchfish {

// Hex object id of either hash: 40 chars (SHA-1) or 64 (SHA-256)
auto looks_object_id(std::string_view str) -> bool;

// Value of an environment variable, or std::nullopt when unset or empty.
auto env_value(std::string_view name) -> std::optional<std::string>;

// $XDG_CONFIG_HOME, else $HOME/.config. Throws if neither is set.
auto xdg_config_home() -> std::filesystem::path;

// String helpers
namespace strutil {
  // Strip trailing CR/LF characters in place
  void rstrip_newlines(std::string& str);

  // Drop leading/trailing spaces, tabs, CR and LF
  auto trim(std::string_view sv) -> std::string;
}

}
