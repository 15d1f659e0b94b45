#include "snapvc/repo.hpp"

#include <filesystem>
#include <iostream>

int cmd_init(int /*argc*/, char ** /*argv*/) {
  try {
    const std::filesystem::path root = std::filesystem::current_path();
    const snapvc::Repository repo{root};
    if (!repo.init()) {
      std::cout << "Repository already initialized at " << repo.meta_dir() << "\n";
      return 0;
    }
    std::cout << "Initialized empty snapvc repository in " << repo.meta_dir() << "\n";
    return 0;
  } catch (const std::exception &e) {
    std::cerr << "init: " << e.what() << "\n";
    return 1;
  }
}
