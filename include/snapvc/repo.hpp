#pragma once
#include "snapvc/config.hpp"
#include "snapvc/message.hpp"
#include "snapvc/snapshot.hpp"
#include "snapvc/state_store.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace snapvc {

enum class LogFormat : std::uint8_t {
  Full,  // whole message
  Short, // first line of the message
};

struct StageResult {
  std::size_t staged = 0;                              // newly added
  std::vector<std::filesystem::path> already_staged;   // skipped duplicates
};

struct RepoStatus {
  StagedSet staged;
  std::size_t tracked = 0;
  std::size_t commits = 0;
  bool head = true;
};

struct CheckoutResult {
  std::string hash;
  bool is_head = false;
};

/**
 * A repository rooted at an explicit directory. Owns the HEAD/DETACHED
 * mode: add, remove, commit and reset are refused with
 * Error(RepositoryNotMutable) unless the working tree is at the last commit.
 */
class Repository {
public:
  explicit Repository(std::filesystem::path root);

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }
  [[nodiscard]] auto meta_dir() const -> std::filesystem::path { return root_ / consts::kMetaDir; }
  [[nodiscard]] auto is_initialized() const -> bool;

  // Create .snapvc. Returns false (and changes nothing) if the repository is
  // already initialized; throws Error(IOFailure) if .snapvc holds anything
  // else.
  bool init(const Settings &settings = Settings{}) const;

  // Queue files for the next commit. Relative paths are taken relative to the
  // root. Every path is checked before any is staged.
  StageResult stage(const std::vector<std::filesystem::path> &paths) const;
  // Single path; an already staged path is Error(AlreadyStaged).
  void stage_one(const std::filesystem::path &path) const;
  void unstage(const std::filesystem::path &path) const;

  // Snapshot staged and carried-forward files. The message is requested only
  // once there is something to commit, outside the repository lock.
  CommitResult commit(MessageProvider &messages) const;
  CommitResult commit(std::string_view message) const;

  [[nodiscard]] auto log(LogFormat format = LogFormat::Full) const -> CommitLog;
  [[nodiscard]] auto status() const -> RepoStatus;

  // Restore the working tree to `ref`. A target other than the last commit
  // needs confirmed == true (Error(NotConfirmed) otherwise).
  CheckoutResult checkout(std::string_view ref, bool confirmed) const;

  // Restore to `ref` and drop every later commit. Always needs confirmation.
  // Tracked becomes the files of the kept snapshots; staged is kept.
  void reset(std::string_view ref, bool confirmed) const;

private:
  [[nodiscard]] auto open_store() const -> StateStore;
  static void require_head(const StateStore &store, std::string_view op);
  [[nodiscard]] auto absolute_in_root(const std::filesystem::path &p) const
      -> std::filesystem::path;

  std::filesystem::path root_;
};

} // namespace snapvc
