#include "touchfish/error.hpp"

namespace touchfish {

std::string_view errc_name(errc code) {
  switch (code) {
  case errc::invalid_window:
    return "invalid window";
  case errc::malformed_time_string:
    return "malformed time";
  case errc::clock_read_failure:
    return "clock read failure";
  case errc::random_source_failure:
    return "random source failure";
  case errc::repository_query_failure:
    return "repository query failure";
  case errc::commit_failed:
    return "commit failed";
  case errc::config_io_failure:
    return "config i/o failure";
  }
  return "unknown error";
}

Error::Error(errc code, const std::string &message) : std::runtime_error(message), code_(code) {}

} // namespace touchfish
