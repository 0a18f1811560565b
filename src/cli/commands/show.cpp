#include "cli/report.hpp"
#include "touchfish/config.hpp"
#include "touchfish/time.hpp"

#include <iostream>

int cmd_show(int /*argc*/, char ** /*argv*/) {
  try {
    const touchfish::TimeWindow window = touchfish::load_window(touchfish::config_path());
    std::cout << "Current time window: " << touchfish::format_time_of_day(window.start) << " - "
              << touchfish::format_time_of_day(window.end) << "\n";
    return 0;
  } catch (const std::exception &e) {
    return touchfish::cli::report_failure("show", e);
  }
}
