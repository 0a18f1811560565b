#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace touchfish {

enum class errc {
  invalid_window,
  malformed_time_string,
  clock_read_failure,
  random_source_failure,
  repository_query_failure, // absorbed by the history reader, never reaches a command
  commit_failed,
  config_io_failure,
};

// Short stable name, e.g. "invalid window"
auto errc_name(errc code) -> std::string_view;

class Error : public std::runtime_error {
public:
  Error(errc code, const std::string &message);

  [[nodiscard]] auto code() const noexcept -> errc { return code_; }

private:
  errc code_;
};

} // namespace touchfish
