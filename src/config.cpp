#include "touchfish/config.hpp"

#include "touchfish/consts.hpp"
#include "touchfish/error.hpp"
#include "touchfish/fs.hpp"
#include "touchfish/util.hpp"

#include <exception>
#include <sstream>
#include <string>
#include <string_view>

namespace touchfish {

std::filesystem::path config_path() {
  if (auto over = env_value(consts::kEnvConfig))
    return std::filesystem::path(*over);
  try {
    return xdg_config_home() / consts::kAppName / consts::kConfigFile;
  } catch (const std::exception &e) {
    throw Error(errc::config_io_failure, std::string("no config location: ") + e.what());
  }
}

auto load_window(const std::filesystem::path &path) -> TimeWindow {
  std::string start{consts::kDefaultStart};
  std::string end{consts::kDefaultEnd};

  if (fs::exists(path)) {
    std::string text;
    try {
      text = fs::read_text(path);
    } catch (const std::exception &e) {
      throw Error(errc::config_io_failure, e.what());
    }

    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
      std::string_view sv{line};
      if (sv.empty() || sv[0] == '#')
        continue; // allow comments
      const auto colon = sv.find(':');
      if (colon == std::string_view::npos)
        continue;
      const std::string key = strutil::trim(sv.substr(0, colon));
      // value keeps its own ':' ("09:00")
      const std::string value = strutil::trim(sv.substr(colon + 1));
      if (key == consts::kStartKey)
        start = value;
      else if (key == consts::kEndKey)
        end = value;
    }
  }
  return make_window(start, end);
}

void save_window(const std::filesystem::path &path, const TimeWindow &window) {
  validate_window(window);

  std::ostringstream os;
  os << consts::kStartKey << ": " << format_time_of_day(window.start) << '\n'
     << consts::kEndKey << ": " << format_time_of_day(window.end) << '\n';
  try {
    fs::write_text_atomic(path, os.str());
  } catch (const std::exception &e) {
    throw Error(errc::config_io_failure, e.what());
  }
}

} // namespace touchfish
