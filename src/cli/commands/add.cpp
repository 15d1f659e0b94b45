#include "cli/common.hpp"
#include "snapvc/repo.hpp"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <vector>

namespace fs = std::filesystem;

int cmd_add(int argc, char **argv) {
  if (argc < 2) {
    std::cerr << "usage: snapvc add <path> [<path> ...]\n";
    return 2;
  }
  auto repo = snapvc::cli::open_repo("add");
  if (!repo)
    return 1;

  // Collect unique paths while preserving order; relative to the shell's cwd
  std::vector<fs::path> paths;
  paths.reserve(static_cast<std::size_t>(argc) - 1);
  for (int i = 1; i < argc; ++i) {
    fs::path path = fs::absolute(argv[i]).lexically_normal();
    if (std::ranges::find(paths, path) == paths.end()) {
      paths.push_back(std::move(path));
    }
  }

  try {
    const auto result = repo->stage(paths);
    for (const auto &p : result.already_staged) {
      std::cout << p.lexically_relative(repo->root()).generic_string() << " already staged\n";
    }
    std::cout << result.staged << " file" << (result.staged == 1 ? "" : "s") << " staged\n";
    return 0;
  } catch (const std::exception &e) {
    return snapvc::cli::report("add", e);
  }
}
