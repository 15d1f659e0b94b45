#include "snapvc/error.hpp"
#include "snapvc/repo.hpp"

#include <algorithm>
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

// Counts how often the core asked for a message
class CountingMessage : public snapvc::MessageProvider {
public:
  std::string request_message() override {
    ++calls;
    return "counted\n";
  }
  int calls = 0;
};

int main() {
  const fs::path root =
      fs::temp_directory_path() / ("snapvc_commit_" + std::to_string(std::random_device{}()));
  fs::create_directories(root);

  try {
    snapvc::Repository repo{root};
    repo.init();
    const fs::path snaps = repo.meta_dir() / "commits";

    // Nothing staged: no message requested, no commit
    CountingMessage counter;
    try {
      (void)repo.commit(counter);
      std::cerr << "empty commit succeeded\n";
      return 1;
    } catch (const snapvc::Error &e) {
      if (e.code() != snapvc::ErrorCode::NothingToCommit) {
        std::cerr << "expected NothingToCommit, got " << e.what() << "\n";
        return 1;
      }
    }
    if (counter.calls != 0 || repo.status().commits != 0) {
      std::cerr << "empty commit had side effects\n";
      return 1;
    }

    // First commit copies staged files, nested ones included
    write_file(root / "a.txt", "hello\n");
    write_file(root / "src" / "lib" / "b.txt", "B1\n");
    (void)repo.stage({"a.txt", "src/lib/b.txt"});
    const auto c1 = repo.commit(counter);
    if (counter.calls != 1 || c1.hash.size() != 40 || !c1.warnings.empty()) {
      std::cerr << "first commit result mismatch\n";
      return 1;
    }
    if (slurp(snaps / c1.hash / "a.txt") != "hello\n" ||
        slurp(snaps / c1.hash / "src" / "lib" / "b.txt") != "B1\n") {
      std::cerr << "first snapshot content mismatch\n";
      return 1;
    }
    auto st = repo.status();
    if (!st.staged.empty() || st.tracked != 2 || st.commits != 1 || !st.head) {
      std::cerr << "state after first commit mismatch\n";
      return 1;
    }
    if (repo.log().back().message != "counted\n") {
      std::cerr << "message not recorded\n";
      return 1;
    }

    // Carry-forward reads the previous snapshot, not the working tree
    write_file(root / "src" / "lib" / "b.txt", "B2 unstaged edit\n");
    write_file(root / "c.txt", "C\n");
    (void)repo.stage({"c.txt"});
    const auto c2 = repo.commit("second\n");
    if (slurp(snaps / c2.hash / "src" / "lib" / "b.txt") != "B1\n" ||
        slurp(snaps / c2.hash / "a.txt") != "hello\n" ||
        slurp(snaps / c2.hash / "c.txt") != "C\n") {
      std::cerr << "carry-forward mismatch\n";
      return 1;
    }
    if (repo.status().tracked != 3) {
      std::cerr << "tracked did not grow\n";
      return 1;
    }

    // A deletion alone is something to commit; tracked keeps the path
    fs::remove(root / "c.txt");
    const auto c3 = repo.commit("drop c\n");
    if (fs::exists(snaps / c3.hash / "c.txt") || !fs::exists(snaps / c3.hash / "a.txt")) {
      std::cerr << "deletion not reflected in snapshot\n";
      return 1;
    }
    if (repo.status().tracked != 3) {
      std::cerr << "tracked shrank on commit\n";
      return 1;
    }

    // Identical snapshots still get distinct ids
    write_file(root / "c.txt", "C\n");
    (void)repo.stage({"c.txt"});
    const auto c4 = repo.commit("second\n");
    if (c4.hash == c2.hash) {
      std::cerr << "identical snapshots share an id\n";
      return 1;
    }

    // A tracked file missing from the previous snapshot is skipped with a warning
    fs::remove(snaps / c4.hash / "a.txt");
    write_file(root / "d.txt", "D\n");
    (void)repo.stage({"d.txt"});
    const auto c5 = repo.commit("fault\n");
    if (c5.warnings.size() != 1 || c5.warnings.front().find("a.txt") == std::string::npos ||
        c5.warnings.front().find("ConsistencyFault") == std::string::npos) {
      std::cerr << "expected one consistency warning for a.txt\n";
      return 1;
    }
    if (fs::exists(snaps / c5.hash / "a.txt") || !fs::exists(snaps / c5.hash / "d.txt")) {
      std::cerr << "faulty file handling mismatch\n";
      return 1;
    }

    // A staged file that vanished before commit aborts without changes
    write_file(root / "e.txt", "E\n");
    (void)repo.stage({"e.txt"});
    fs::remove(root / "e.txt");
    const auto before = repo.log().size();
    try {
      (void)repo.commit("gone\n");
      std::cerr << "commit of a vanished staged file succeeded\n";
      return 1;
    } catch (const snapvc::Error &e) {
      if (e.code() != snapvc::ErrorCode::FileNotFound ||
          std::string(e.what()).find("e.txt") == std::string::npos) {
        std::cerr << "unexpected error: " << e.what() << "\n";
        return 1;
      }
    }
    if (repo.log().size() != before || repo.status().staged.size() != 1) {
      std::cerr << "failed commit changed state\n";
      return 1;
    }
    // No half-built snapshot directories remain
    for (const auto &e : fs::directory_iterator(snaps)) {
      if (e.path().filename().string().starts_with(".tmp-")) {
        std::cerr << "leftover temp snapshot " << e.path() << "\n";
        return 1;
      }
    }

    // Temp trees left by an interrupted commit are swept by the next one
    const fs::path stale = snaps / ".tmp-0123456789abcdef";
    write_file(stale / "half.txt", "half");
    repo.unstage("e.txt");
    write_file(root / "f.txt", "F\n");
    (void)repo.stage({"f.txt"});
    (void)repo.commit("sweep\n");
    if (fs::exists(stale)) {
      std::cerr << "stale temp snapshot survived a commit\n";
      return 1;
    }

    // Short log keeps only the first line
    const auto short_log = repo.log(snapvc::LogFormat::Short);
    if (short_log.size() != 6 || short_log.front().message != "counted" ||
        !std::ranges::all_of(short_log, [](const snapvc::Commit &c) {
          return c.message.find('\n') == std::string::npos;
        })) {
      std::cerr << "short log mismatch\n";
      return 1;
    }

    // Time-seeded ids, as configured per repository
    const fs::path troot = root / "timed";
    fs::create_directories(troot);
    snapvc::Repository timed{troot};
    timed.init(snapvc::Settings{.hash_scheme = snapvc::HashScheme::Time});
    write_file(troot / "t.txt", "t");
    (void)timed.stage({"t.txt"});
    const auto t1 = timed.commit("t1").hash;
    write_file(troot / "t.txt", "t2");
    (void)timed.stage({"t.txt"});
    const auto t2 = timed.commit("t2").hash;
    if (t1 == t2 || t1.size() != 40 || t2.size() != 40 || timed.log().size() != 2) {
      std::cerr << "time-seeded ids mismatch\n";
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
