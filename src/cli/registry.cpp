#include "cli/registry.hpp"

#include <algorithm>
#include <iostream>
#include <utility>
#include <vector>

namespace snapvc::cli {

namespace {

std::vector<CommandInfo> &commands() {
  static std::vector<CommandInfo> all;
  return all;
}

bool is_help_flag(std::string_view arg) { return arg == "-h" || arg == "--help"; }

} // namespace

void register_command(CommandInfo info) {
  auto &all = commands();
  const auto it =
      std::ranges::find_if(all, [&](const CommandInfo &c) { return c.name == info.name; });
  if (it != all.end())
    *it = std::move(info);
  else
    all.push_back(std::move(info));
}

const CommandInfo *find_command(std::string_view name) {
  const auto &all = commands();
  const auto it = std::ranges::find_if(all, [&](const CommandInfo &c) { return c.name == name; });
  return it == all.end() ? nullptr : &*it;
}

void print_usage(std::ostream &os) {
  std::size_t width = 0;
  for (const auto &c : commands())
    width = std::max(width, c.name.size());

  os << "usage: snapvc <command> [args]\n\ncommands:\n";
  for (const auto &c : commands()) {
    os << "  " << c.name << std::string(width - c.name.size() + 2, ' ') << c.summary << "\n";
  }
  os << "\nRun `snapvc help <command>` for its arguments.\n";
}

bool print_command_help(std::string_view name) {
  const auto *c = find_command(name);
  if (!c)
    return false;
  std::cout << "usage: snapvc " << c->name;
  if (!c->usage.empty())
    std::cout << " " << c->usage;
  std::cout << "\n\n  " << c->summary << "\n";
  return true;
}

int dispatch(int argc, char **argv) {
  if (argc < 2) {
    print_usage(std::cerr);
    return 2;
  }
  const std::string_view name = argv[1];
  if (is_help_flag(name)) {
    print_usage(std::cout);
    return 0;
  }

  const auto *c = find_command(name);
  if (!c) {
    std::cerr << "snapvc: '" << name << "' is not a command\n";
    print_usage(std::cerr);
    return 2;
  }
  // `snapvc <command> --help` never reaches the handler
  if (argc > 2 && is_help_flag(argv[2])) {
    (void)print_command_help(name);
    return 0;
  }
  // The handler sees its own name as argv[0]
  return c->fn(argc - 1, argv + 1);
}

} // namespace snapvc::cli
