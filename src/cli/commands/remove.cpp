#include "cli/common.hpp"
#include "snapvc/repo.hpp"

#include <filesystem>
#include <iostream>

int cmd_remove(int argc, char **argv) {
  if (argc != 2) {
    std::cerr << "usage: snapvc remove <path>\n";
    return 2;
  }
  auto repo = snapvc::cli::open_repo("remove");
  if (!repo)
    return 1;
  try {
    const auto path = std::filesystem::absolute(argv[1]).lexically_normal();
    repo->unstage(path);
    std::cout << "unstaged: " << path.lexically_relative(repo->root()).generic_string() << "\n";
    return 0;
  } catch (const std::exception &e) {
    return snapvc::cli::report("remove", e);
  }
}
