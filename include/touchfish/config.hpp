#pragma once
#include "touchfish/time.hpp"

#include <filesystem>

namespace touchfish {

// $TOUCHFISH_CONFIG, else <xdg config home>/git-touchfish-commit/config
std::filesystem::path config_path();

// Read the window from `path`. A missing file or missing key yields the default
// (00:00 - 02:00). Throws Error(errc::config_io_failure) if the file cannot be read,
// Error(errc::malformed_time_string) / Error(errc::invalid_window) for bad contents.
TimeWindow load_window(const std::filesystem::path& path);

// Validate, then overwrite `path` atomically. Throws Error(errc::invalid_window) or
// Error(errc::config_io_failure).
void save_window(const std::filesystem::path& path, const TimeWindow& window);

} // namespace touchfish
