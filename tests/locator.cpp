#include "snapvc/locator.hpp"
#include "snapvc/repo.hpp"

#include <filesystem>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("snapvc_locator_" + std::to_string(std::random_device{}()));
  fs::create_directories(root / "x" / "y" / "z");

  try {
    if (snapvc::discover_root(root / "x")) {
      // Only possible if a parent of the temp dir is itself a repository
      std::cout << "SKIP: temp directory is inside a snapvc repository\n";
      fs::remove_all(root);
      return 0;
    }

    snapvc::Repository repo{root};
    repo.init();

    for (const auto &start : {root, root / "x", root / "x" / "y" / "z", root / "x" / "y" / "z" / ""}) {
      const auto found = snapvc::discover_root(start);
      if (!found || *found != repo.root()) {
        std::cerr << "discover_root(" << start << ") did not find " << repo.root() << "\n";
        return 1;
      }
    }

    std::cout << "OK\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(root);
    return 1;
  }

  std::error_code ec;
  fs::remove_all(root, ec);
  return 0;
}
