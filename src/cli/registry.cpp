#include "cli/registry.hpp"

#include "touchfish/consts.hpp"

#include <map>
#include <ostream>

namespace touchfish::cli {

struct entry {
  command_fn fn;
  std::string help;
};
static std::map<std::string, entry> &table() {
  static std::map<std::string, entry> t;
  return t;
}
static entry &fallback() {
  static entry e{.fn = nullptr, .help = {}};
  return e;
}

void register_command(const std::string &name, command_fn fn, const std::string &help) {
  table()[name] = entry{.fn = fn, .help = help};
}

command_fn find_command(const std::string &name) {
  const auto it = table().find(name);
  return it == table().end() ? nullptr : it->second.fn;
}

void set_default_command(command_fn fn, const std::string &help) {
  fallback() = entry{.fn = fn, .help = help};
}

command_fn default_command() { return fallback().fn; }

void print_usage(std::ostream &os) {
  os << "usage: " << consts::kProgramName << " <command> [args]\n\n";
  os << "commands:\n";
  for (auto &[name, e] : table()) {
    os << "  " << name << "  " << e.help << "\n";
  }
  if (fallback().fn)
    os << "  ...  " << fallback().help << "\n";
}

} // namespace touchfish::cli
