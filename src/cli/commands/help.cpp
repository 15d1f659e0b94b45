#include "cli/registry.hpp"

#include <iostream>

int cmd_help(int argc, char **argv) {
  if (argc < 2) {
    snapvc::cli::print_usage(std::cout);
    return 0;
  }
  if (!snapvc::cli::print_command_help(argv[1])) {
    std::cerr << "help: unknown command: " << argv[1] << "\n";
    return 2;
  }
  return 0;
}
