#include "cli/common.hpp"
#include "snapvc/error.hpp"
#include "snapvc/repo.hpp"

#include <iostream>
#include <string>

int cmd_reset(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: snapvc reset <hash-prefix> [-y | --yes]\n";
    return 2;
  }
  const std::string ref = argv[1];
  bool yes = false;
  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    yes = yes || a == "-y" || a == "--yes";
  }

  auto repo = snapvc::cli::open_repo("reset");
  if (!repo)
    return 1;
  try {
    // Without --yes this only validates: HEAD mode and the reference are
    // checked before the user is asked anything.
    try {
      repo->reset(ref, yes);
    } catch (const snapvc::Error &e) {
      if (e.code() != snapvc::ErrorCode::NotConfirmed)
        throw;
      std::cout << "WARNING! All commits after " << ref << " will be lost!\n"
                << "History will be lost. This cannot be undone!\n";
      if (!snapvc::cli::confirm("Do you want to proceed?")) {
        std::cout << "Aborting reset\n";
        return 1;
      }
      repo->reset(ref, true);
    }
    std::cout << "Successfully reset\n";
    return 0;
  } catch (const std::exception &e) {
    return snapvc::cli::report("reset", e);
  }
}
