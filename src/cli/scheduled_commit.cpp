#include "cli/scheduled_commit.hpp"

#include "cli/report.hpp"
#include "touchfish/config.hpp"
#include "touchfish/generator.hpp"
#include "touchfish/history.hpp"
#include "touchfish/time.hpp"

#include <exception>
#include <filesystem>
#include <iostream>

namespace touchfish::cli {

int run_scheduled_commit(std::string_view name, const CommitOptions &options) {
  try {
    const TimeWindow window = load_window(config_path());
    const CommitRunner runner;
    const auto reference = HistoryReader{std::filesystem::current_path(), runner.git()}
                               .last_commit_time();

    TimestampGenerator generator;
    const GeneratedTimestamp stamp = generator.generate(window, reference, timeutil::now());

    if (options.amend)
      std::cout << "Amending the last commit with random time " << stamp.rfc3339() << "...\n";
    else
      std::cout << "Running git commit with random time " << stamp.rfc3339() << "...\n";
    std::cout.flush();

    runner.commit(stamp, options);

    std::cout << (options.amend ? "amend succeeded.\n" : "git commit succeeded.\n");
    return 0;
  } catch (const std::exception &e) {
    return report_failure(name, e);
  }
}

} // namespace touchfish::cli
