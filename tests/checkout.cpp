#include "snapvc/error.hpp"
#include "snapvc/repo.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <random>
#include <string>

namespace fs = std::filesystem;

static void write_file(const fs::path &p, std::string_view s) {
  fs::create_directories(p.parent_path());
  std::ofstream(p, std::ios::binary) << s;
}

static std::string slurp(const fs::path &p) {
  std::ifstream ifs(p, std::ios::binary);
  return std::string{std::istreambuf_iterator<char>(ifs), std::istreambuf_iterator<char>()};
}

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("snapvc_checkout_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    snapvc::Repository repo{root};
    repo.init();

    // Empty history
    try {
      (void)repo.checkout("HEAD", true);
      std::cerr << "checkout HEAD on empty history succeeded\n";
      return 1;
    } catch (const snapvc::Error &e) {
      if (e.code() != snapvc::ErrorCode::EmptyHistory) {
        std::cerr << "expected EmptyHistory, got " << e.what() << "\n";
        return 1;
      }
    }

    // hello -> world, as two commits
    write_file(root / "a.txt", "hello");
    (void)repo.stage({"a.txt"});
    const std::string h1 = repo.commit("first").hash;

    write_file(root / "a.txt", "world");
    write_file(root / "nested" / "deep" / "n.txt", "N");
    write_file(root / "mixed" / "m.txt", "M");
    (void)repo.stage({"a.txt", "nested/deep/n.txt", "mixed/m.txt"});
    const std::string h2 = repo.commit("second").hash;

    // Untracked content must survive every restore
    write_file(root / "mixed" / "untracked.txt", "U");
    write_file(root / "notes" / "u.txt", "U");

    // Going back needs confirmation and changes nothing without it
    try {
      (void)repo.checkout(h1.substr(0, 8), false);
      std::cerr << "unconfirmed checkout succeeded\n";
      return 1;
    } catch (const snapvc::Error &e) {
      if (e.code() != snapvc::ErrorCode::NotConfirmed) {
        std::cerr << "expected NotConfirmed, got " << e.what() << "\n";
        return 1;
      }
    }
    if (slurp(root / "a.txt") != "world" || !repo.status().head) {
      std::cerr << "unconfirmed checkout changed the tree\n";
      return 1;
    }

    const auto r1 = repo.checkout(h1.substr(0, 8), true);
    if (r1.hash != h1 || r1.is_head) {
      std::cerr << "checkout result mismatch\n";
      return 1;
    }
    if (slurp(root / "a.txt") != "hello" || repo.status().head) {
      std::cerr << "checkout of first commit mismatch\n";
      return 1;
    }
    // Directories that only held tracked files are gone; others keep their rest
    if (fs::exists(root / "nested")) {
      std::cerr << "tracked-only directory not pruned\n";
      return 1;
    }
    if (fs::exists(root / "mixed" / "m.txt") || slurp(root / "mixed" / "untracked.txt") != "U" ||
        slurp(root / "notes" / "u.txt") != "U") {
      std::cerr << "untracked files disturbed\n";
      return 1;
    }

    // Detached checkout to another old commit is fine, HEAD returns
    const auto r2 = repo.checkout("HEAD", false);
    if (r2.hash != h2 || !r2.is_head || !repo.status().head) {
      std::cerr << "checkout HEAD result mismatch\n";
      return 1;
    }
    if (slurp(root / "a.txt") != "world" || slurp(root / "nested" / "deep" / "n.txt") != "N" ||
        slurp(root / "mixed" / "m.txt") != "M") {
      std::cerr << "checkout HEAD content mismatch\n";
      return 1;
    }

    // Idempotent
    (void)repo.checkout("HEAD", true);
    if (slurp(root / "a.txt") != "world" || !repo.status().head ||
        slurp(root / "nested" / "deep" / "n.txt") != "N") {
      std::cerr << "second checkout HEAD changed something\n";
      return 1;
    }

    // Checking out the last commit by hash is also HEAD
    if (!repo.checkout(h2, false).is_head) {
      std::cerr << "last commit by hash not reported as HEAD\n";
      return 1;
    }

    // A missing snapshot aborts before the working tree is touched
    fs::remove_all(repo.meta_dir() / "commits" / h1);
    try {
      (void)repo.checkout(h1, true);
      std::cerr << "checkout of a missing snapshot succeeded\n";
      return 1;
    } catch (const snapvc::Error &e) {
      if (e.code() != snapvc::ErrorCode::IOFailure) {
        std::cerr << "expected IOFailure, got " << e.what() << "\n";
        return 1;
      }
    }
    if (slurp(root / "a.txt") != "world" || !repo.status().head) {
      std::cerr << "failed checkout changed state\n";
      return 1;
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
