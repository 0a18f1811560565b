#pragma once
#include <exception>
#include <string_view>

namespace touchfish::cli {

// Print "cmd: <kind>: message" to stderr (kind only for touchfish::Error). Returns 1.
int report_failure(std::string_view cmd, const std::exception &e);

} // namespace touchfish::cli
