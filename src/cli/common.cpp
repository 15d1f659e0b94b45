#include "cli/common.hpp"

#include "snapvc/error.hpp"
#include "snapvc/locator.hpp"

#include <filesystem>
#include <iostream>
#include <string>

namespace snapvc::cli {

std::optional<Repository> open_repo(std::string_view cmd) {
  auto root = discover_root(std::filesystem::current_path());
  if (!root) {
    std::cerr << cmd << ": not a snapvc repo (run `snapvc init`)\n";
    return std::nullopt;
  }
  return Repository{*root};
}

bool confirm(std::string_view question) {
  std::cout << question << " (y/N) " << std::flush;
  std::string answer;
  if (!std::getline(std::cin, answer))
    return false;
  return answer == "y" || answer == "Y";
}

int report(std::string_view cmd, const std::exception &e) {
  std::cerr << cmd << ": " << e.what() << "\n";
  return 1;
}

} // namespace snapvc::cli
