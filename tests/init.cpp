#include "snapvc/config.hpp"
#include "snapvc/error.hpp"
#include "snapvc/repo.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

int main() {
  // Make a unique temp repo root
  const auto base = fs::temp_directory_path();
  const std::string suffix = std::to_string(std::random_device{}());
  const fs::path repo_root = base / ("snapvc_init_test_" + suffix);

  try {
    fs::create_directories(repo_root);

    snapvc::Repository repo{repo_root};
    if (repo.is_initialized()) {
      std::cerr << "repo unexpectedly initialized before init()\n";
      return 1;
    }

    // Operations on an uninitialized directory are NotARepository
    try {
      (void)repo.status();
      std::cerr << "status succeeded without a repository\n";
      return 1;
    } catch (const snapvc::Error &e) {
      if (e.code() != snapvc::ErrorCode::NotARepository) {
        std::cerr << "expected NotARepository, got " << snapvc::to_string(e.code()) << "\n";
        return 1;
      }
    }

    if (!repo.init()) {
      std::cerr << "first init() reported an existing repository\n";
      return 1;
    }

    // Check directory layout
    const fs::path meta = repo_root / ".snapvc";
    for (const char *name : {"staged", "tracked", "history", "status", "config"}) {
      if (!fs::is_regular_file(meta / name)) {
        std::cerr << name << " missing\n";
        return 1;
      }
    }
    if (!fs::is_directory(meta / "commits")) {
      std::cerr << "commits/ missing\n";
      return 1;
    }
    if (slurp(meta / "status") != "head: true\n") {
      std::cerr << "status content mismatch: [" << slurp(meta / "status") << "]\n";
      return 1;
    }
    if (!slurp(meta / "staged").empty() || !slurp(meta / "history").empty()) {
      std::cerr << "fresh state files are not empty\n";
      return 1;
    }

    // Config written with defaults and loadable
    const auto settings = snapvc::load_settings(repo_root);
    if (settings.hash_scheme != snapvc::HashScheme::Content || settings.lock_retries != 20) {
      std::cerr << "config defaults mismatch\n";
      return 1;
    }

    const auto st = repo.status();
    if (!st.head || !st.staged.empty() || st.commits != 0 || st.tracked != 0) {
      std::cerr << "fresh status mismatch\n";
      return 1;
    }

    // Calling init again is a no-op, not an error
    if (repo.init()) {
      std::cerr << "second init() claimed to create the repository\n";
      return 1;
    }

    // An existing but empty .snapvc directory is initialized in place
    const fs::path other = base / ("snapvc_init_empty_" + suffix);
    fs::create_directories(other / ".snapvc");
    snapvc::Repository repo2{other};
    const bool created = repo2.init();
    fs::remove_all(other);
    if (!created) {
      std::cerr << "init() refused an empty .snapvc directory\n";
      return 1;
    }

    // A populated .snapvc whose status file is gone is left alone
    const fs::path broken = base / ("snapvc_init_broken_" + suffix);
    fs::create_directories(broken);
    snapvc::Repository repo3{broken};
    repo3.init();
    {
      std::ofstream(broken / "a.txt") << "a";
    }
    (void)repo3.stage({"a.txt"});
    (void)repo3.commit("keep me");
    const std::string history = slurp(broken / ".snapvc" / "history");
    fs::remove(broken / ".snapvc" / "status");
    bool refused = false;
    try {
      (void)repo3.init();
    } catch (const snapvc::Error &e) {
      refused = e.code() == snapvc::ErrorCode::IOFailure;
    }
    const bool history_kept = slurp(broken / ".snapvc" / "history") == history;
    fs::remove_all(broken);
    if (!refused || !history_kept || history.empty()) {
      std::cerr << "init() overwrote a populated .snapvc directory\n";
      return 1;
    }

    std::cout << "init test OK: " << repo_root << "\n";
  } catch (const std::exception &e) {
    std::cerr << "exception: " << e.what() << "\n";
    fs::remove_all(repo_root);
    return 1;
  }

  // Clean up
  std::error_code ec;
  fs::remove_all(repo_root, ec);
  return 0;
}
