#include "cli/report.hpp"
#include "touchfish/config.hpp"
#include "touchfish/time.hpp"

#include <iostream>
#include <string>

int cmd_set(int argc, char **argv) {
  if (argc != 3) {
    std::cerr << "usage: git-tc set <start> <end>  (times as HH:MM, e.g. 09:00 18:30)\n";
    return 2;
  }

  try {
    const touchfish::TimeWindow window = touchfish::make_window(argv[1], argv[2]);
    touchfish::save_window(touchfish::config_path(), window);
    std::cout << "Time window set to " << touchfish::format_time_of_day(window.start) << " - "
              << touchfish::format_time_of_day(window.end) << "\n";
    return 0;
  } catch (const std::exception &e) {
    return touchfish::cli::report_failure("set", e);
  }
}
