#include "cli/report.hpp"

#include "touchfish/error.hpp"

#include <iostream>

namespace touchfish::cli {

int report_failure(std::string_view cmd, const std::exception &e) {
  std::cerr << cmd << ": ";
  if (const auto *err = dynamic_cast<const Error *>(&e))
    std::cerr << errc_name(err->code()) << ": ";
  std::cerr << e.what() << "\n";
  return 1;
}

} // namespace touchfish::cli
