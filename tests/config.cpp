#include "touchfish/config.hpp"
#include "touchfish/error.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

static bool load_fails_with(const fs::path &p, touchfish::errc expected) {
  try {
    (void)touchfish::load_window(p);
  } catch (const touchfish::Error &e) {
    return e.code() == expected;
  }
  return false;
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("touchfish_config_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    const fs::path cfg = root / "git-touchfish-commit" / "config";

    // 1) Nothing stored yet -> default window
    if (touchfish::load_window(cfg) != touchfish::default_window()) {
      std::cerr << "missing file did not yield the default window\n";
      return 1;
    }

    // 2) Store creates the directory and the file
    touchfish::save_window(cfg, touchfish::make_window("9:30", "18:00"));
    if (slurp(cfg) != "start_time: 09:30\nend_time: 18:00\n") {
      std::cerr << "unexpected file contents:\n" << slurp(cfg);
      return 1;
    }
    if (touchfish::load_window(cfg) != touchfish::make_window("09:30", "18:00")) {
      std::cerr << "stored window not read back\n";
      return 1;
    }
    if (fs::exists(cfg.string() + ".tmp")) {
      std::cerr << "temp file left behind\n";
      return 1;
    }

    // 3) Invalid windows are never stored
    try {
      touchfish::save_window(cfg, touchfish::TimeWindow{.start = {20, 0}, .end = {8, 0}});
      std::cerr << "inverted window stored\n";
      return 1;
    } catch (const touchfish::Error &e) {
      if (e.code() != touchfish::errc::invalid_window) {
        std::cerr << "wrong error for inverted window\n";
        return 1;
      }
    }
    if (touchfish::load_window(cfg) != touchfish::make_window("09:30", "18:00")) {
      std::cerr << "rejected save modified the file\n";
      return 1;
    }

    // 4) Comments, blank lines, unknown keys and a missing key
    write_file(cfg, "# edited by hand\n\nend_time:   03:15  \nfavourite: tea\n");
    if (touchfish::load_window(cfg) != touchfish::make_window("00:00", "03:15")) {
      std::cerr << "partial config not merged with defaults\n";
      return 1;
    }
    write_file(cfg, "");
    if (touchfish::load_window(cfg) != touchfish::default_window()) {
      std::cerr << "empty config did not yield the default window\n";
      return 1;
    }

    // 5) Out-of-band edits are validated on load
    write_file(cfg, "start_time: 10:00\nend_time: 09:00\n");
    if (!load_fails_with(cfg, touchfish::errc::invalid_window)) {
      std::cerr << "inverted stored window accepted\n";
      return 1;
    }
    write_file(cfg, "start_time: noon\nend_time: 13:00\n");
    if (!load_fails_with(cfg, touchfish::errc::malformed_time_string)) {
      std::cerr << "malformed stored time accepted\n";
      return 1;
    }

    // 6) Unwritable location
    const fs::path blocker = root / "blocker";
    write_file(blocker, "x");
    try {
      touchfish::save_window(blocker / "config", touchfish::default_window());
      std::cerr << "write under a regular file succeeded\n";
      return 1;
    } catch (const touchfish::Error &e) {
      if (e.code() != touchfish::errc::config_io_failure) {
        std::cerr << "wrong error for unwritable path\n";
        return 1;
      }
    }

    // 7) Location: explicit override, then XDG
    ::setenv("TOUCHFISH_CONFIG", (root / "override.conf").c_str(), 1);
    if (touchfish::config_path() != root / "override.conf") {
      std::cerr << "TOUCHFISH_CONFIG ignored\n";
      return 1;
    }
    ::unsetenv("TOUCHFISH_CONFIG");
    ::setenv("XDG_CONFIG_HOME", root.c_str(), 1);
    if (touchfish::config_path() != cfg) {
      std::cerr << "XDG path: " << touchfish::config_path() << "\n";
      return 1;
    }
    ::unsetenv("XDG_CONFIG_HOME");
    ::setenv("HOME", root.c_str(), 1);
    if (touchfish::config_path() != root / ".config" / "git-touchfish-commit" / "config") {
      std::cerr << "HOME fallback: " << touchfish::config_path() << "\n";
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
