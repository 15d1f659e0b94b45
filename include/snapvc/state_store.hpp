#pragma once
#include "snapvc/config.hpp"
#include "snapvc/consts.hpp"
#include "snapvc/fs.hpp"

#include <filesystem>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace snapvc {

struct Commit {
  std::string hash;    // 40-hex, lowercase
  std::string message; // free-form, may be empty or span lines

  bool operator==(const Commit&) const = default;
};

using StagedSet = std::vector<std::filesystem::path>; // absolute, staging order
using TrackedSet = std::set<std::filesystem::path>;   // absolute
using CommitLog = std::vector<Commit>;                // oldest first

// Everything the state files hold, read together.
struct RepositoryState {
  StagedSet staged;
  TrackedSet tracked;
  CommitLog log;
  bool head = true;
};

/**
 * Durable storage for the four state values and the snapshot directories.
 *
 * Reads return the last value a write completed; writes replace a whole file
 * via temp-then-rename, so a crash leaves the previous value readable.
 * Callers serialize read-modify-write sequences with RepoLock.
 */
class StateStore {
public:
  StateStore(std::filesystem::path repo_root, Settings settings);

  [[nodiscard]] const std::filesystem::path& root() const { return root_; }
  [[nodiscard]] const Settings& settings() const { return settings_; }

  [[nodiscard]] auto meta_dir() const -> std::filesystem::path { return root_ / consts::kMetaDir; }
  [[nodiscard]] auto commits_dir() const -> std::filesystem::path {
    return meta_dir() / consts::kCommitsDir;
  }
  [[nodiscard]] auto lock_file() const -> std::filesystem::path {
    return meta_dir() / consts::kLockFile;
  }
  [[nodiscard]] auto snapshot_dir(const std::string& hash) const -> std::filesystem::path {
    return commits_dir() / hash;
  }

  // True once the status file exists (it is written last by create()).
  [[nodiscard]] auto is_initialized() const -> bool;

  // Create the metadata directory, the config file and empty state. The
  // directory may already exist as long as it is empty. Throws
  // Error(IOFailure) otherwise, leaving its contents untouched.
  void create() const;

  // Throws Error(NotARepository) when the repository is missing.
  void require_initialized() const;

  [[nodiscard]] auto read_staged() const -> StagedSet;
  [[nodiscard]] auto read_tracked() const -> TrackedSet;
  [[nodiscard]] auto read_log() const -> CommitLog;
  [[nodiscard]] auto read_head() const -> bool;
  [[nodiscard]] auto read_all() const -> RepositoryState;

  void write_staged(const StagedSet& staged) const;
  void write_tracked(const TrackedSet& tracked) const;
  void write_log(const CommitLog& log) const;
  void write_head(bool head) const;

  // Remove a snapshot tree (no error if absent)
  void remove_snapshot(const std::string& hash) const;

  // Remove half-built commits/.tmp-* trees left by an interrupted commit.
  // Call with the repository lock held.
  void sweep_temp_snapshots() const;

  // Run `fn`, retrying transient failures as configured by io-retries.
  template <class Fn> auto with_io_retry(Fn&& fn) const -> decltype(fn()) {
    return fs::with_retry(settings_.io_retries, settings_.lock_backoff_ms, std::forward<Fn>(fn));
  }

private:
  [[nodiscard]] auto state_file(std::string_view name) const -> std::filesystem::path {
    return meta_dir() / name;
  }
  [[nodiscard]] auto read_state_file(std::string_view name) const -> std::string;
  void write_state_file(std::string_view name, const std::string& text) const;

  std::filesystem::path root_;
  Settings settings_;
};

} // namespace snapvc
