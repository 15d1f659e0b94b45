#pragma once
#include <iosfwd>
#include <string>
#include <string_view>

#include "cli/command.hpp"

namespace snapvc::cli {

struct CommandInfo {
  std::string name;
  command_fn fn = nullptr;
  std::string usage;   // argument synopsis after the command name
  std::string summary; // one line
};

// Commands are listed in registration order. Re-registering a name replaces it.
void register_command(CommandInfo info);
const CommandInfo *find_command(std::string_view name);

void print_usage(std::ostream &os);
// Usage and summary for one command; false if unknown
bool print_command_help(std::string_view name);

// Route `snapvc <command> [args]` to its handler and return the exit code.
int dispatch(int argc, char **argv);

// implemented in register_commands.cpp
void register_all_commands();

} // namespace snapvc::cli
