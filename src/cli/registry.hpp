#pragma once
#include <iosfwd>
#include <string>
#include "cli/command.hpp"

namespace touchfish::cli {

void register_command(const std::string& name, command_fn fn, const std::string& help);
command_fn find_command(const std::string& name);

// Runs when the first argument is not a registered command.
void set_default_command(command_fn fn, const std::string& help);
command_fn default_command();

void print_usage(std::ostream& os);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace touchfish::cli
