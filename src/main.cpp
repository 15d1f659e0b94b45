#include "cli/registry.hpp"

int main(int argc, char **argv) {
  snapvc::cli::register_all_commands();
  return snapvc::cli::dispatch(argc, argv);
}
