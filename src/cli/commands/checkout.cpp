#include "cli/common.hpp"
#include "snapvc/consts.hpp"
#include "snapvc/error.hpp"
#include "snapvc/repo.hpp"

#include <iostream>
#include <string>

int cmd_checkout(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: snapvc checkout <hash-prefix | HEAD> [-q | --quiet]\n";
    return 2;
  }
  const std::string ref = argv[1];
  bool quiet = false;
  for (int i = 2; i < argc; ++i) {
    const std::string a = argv[i];
    quiet = quiet || a == "-q" || a == "--quiet";
  }

  auto repo = snapvc::cli::open_repo("checkout");
  if (!repo)
    return 1;
  try {
    snapvc::CheckoutResult result;
    try {
      result = repo->checkout(ref, quiet);
    } catch (const snapvc::Error &e) {
      if (e.code() != snapvc::ErrorCode::NotConfirmed)
        throw;
      std::cout << "Warning! Uncommitted changes to tracked files will be lost!\n";
      if (!snapvc::cli::confirm("Do you want to proceed?")) {
        std::cout << "Aborting checkout\n";
        return 1;
      }
      result = repo->checkout(ref, true);
    }
    if (result.is_head)
      std::cout << "Checked out HEAD (" << result.hash.substr(0, snapvc::consts::kShortHashLen)
                << ")\n";
    else
      std::cout << "Checked out commit " << result.hash << "\n";
    return 0;
  } catch (const std::exception &e) {
    return snapvc::cli::report("checkout", e);
  }
}
