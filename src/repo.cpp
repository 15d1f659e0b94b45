#include "snapvc/repo.hpp"

#include "snapvc/consts.hpp"
#include "snapvc/error.hpp"
#include "snapvc/fs.hpp"
#include "snapvc/lock.hpp"
#include "snapvc/resolver.hpp"
#include "snapvc/worktree.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace stdfs = std::filesystem;

namespace {
[[nodiscard]] auto normalized_root(const stdfs::path &root) -> stdfs::path {
  auto out = stdfs::absolute(root).lexically_normal();
  if (out.filename().empty() && out.has_relative_path()) {
    out = out.parent_path();
  }
  return out;
}

[[nodiscard]] auto first_line(const std::string &message) -> std::string {
  const auto nl = message.find('\n');
  return nl == std::string::npos ? message : message.substr(0, nl);
}
} // namespace

namespace snapvc {

Repository::Repository(stdfs::path root) : root_(normalized_root(root)) {}

auto Repository::is_initialized() const -> bool {
  return StateStore{root_, Settings{}}.is_initialized();
}

auto Repository::open_store() const -> StateStore {
  StateStore store{root_, load_settings(root_)};
  store.require_initialized();
  return store;
}

void Repository::require_head(const StateStore &store, std::string_view op) {
  if (!store.read_head()) {
    throw Error(ErrorCode::RepositoryNotMutable,
                std::string(op) + ": HEAD is not checked out (run `checkout HEAD` first)");
  }
}

auto Repository::absolute_in_root(const stdfs::path &p) const -> stdfs::path {
  return root_ / worktree::relative_to_root(root_, p);
}

bool Repository::init(const Settings &settings) const {
  const StateStore store{root_, settings};
  if (store.is_initialized()) {
    return false;
  }
  store.create();
  return true;
}

// Staging

StageResult Repository::stage(const std::vector<stdfs::path> &paths) const {
  const auto store = open_store();
  const RepoLock lock{store.lock_file(), store.settings()};
  require_head(store, "add");

  // Validate the whole batch first so a bad path changes nothing
  std::vector<stdfs::path> candidates;
  candidates.reserve(paths.size());
  for (const auto &p : paths) {
    auto abs = absolute_in_root(p);
    if (!fs::is_file(abs)) {
      throw Error(ErrorCode::FileNotFound, "no such file: " + abs.string());
    }
    if (abs.string().find(consts::kLF) != std::string::npos) {
      throw Error(ErrorCode::FileNotFound, "unsupported file name: " + abs.string());
    }
    candidates.push_back(std::move(abs));
  }

  auto staged = store.read_staged();
  StageResult result;
  for (auto &abs : candidates) {
    if (std::ranges::find(staged, abs) != staged.end()) {
      result.already_staged.push_back(std::move(abs));
      continue;
    }
    staged.push_back(std::move(abs));
    ++result.staged;
  }
  if (result.staged > 0) {
    store.write_staged(staged);
  }
  return result;
}

void Repository::stage_one(const stdfs::path &path) const {
  const auto result = stage({path});
  if (!result.already_staged.empty()) {
    throw Error(ErrorCode::AlreadyStaged,
                result.already_staged.front().string() + " is already staged");
  }
}

void Repository::unstage(const stdfs::path &path) const {
  const auto store = open_store();
  const RepoLock lock{store.lock_file(), store.settings()};
  require_head(store, "remove");

  const auto abs = absolute_in_root(path);
  auto staged = store.read_staged();
  const auto it = std::ranges::find(staged, abs);
  if (it == staged.end()) {
    throw Error(ErrorCode::NotStaged, abs.string() + " is not staged");
  }
  staged.erase(it);
  store.write_staged(staged);
}

// Commits

CommitResult Repository::commit(MessageProvider &messages) const {
  const auto store = open_store();
  {
    const RepoLock lock{store.lock_file(), store.settings()};
    require_head(store, "commit");
    if (snapshot::nothing_to_commit(store.read_all())) {
      throw Error(ErrorCode::NothingToCommit,
                  "nothing to commit (no staged files or deletions); try `add` first");
    }
  }

  // May block on an editor: the lock is not held here
  const std::string message = messages.request_message();

  const RepoLock lock{store.lock_file(), store.settings()};
  require_head(store, "commit");
  return snapshot::commit(store, store.read_all(), message);
}

CommitResult Repository::commit(std::string_view message) const {
  FixedMessage fixed{std::string(message)};
  return commit(fixed);
}

auto Repository::log(LogFormat format) const -> CommitLog {
  auto log = open_store().read_log();
  if (format == LogFormat::Short) {
    for (auto &c : log) {
      c.message = first_line(c.message);
    }
  }
  return log;
}

auto Repository::status() const -> RepoStatus {
  const auto state = open_store().read_all();
  return RepoStatus{.staged = state.staged,
                    .tracked = state.tracked.size(),
                    .commits = state.log.size(),
                    .head = state.head};
}

// Checkout / reset

CheckoutResult Repository::checkout(std::string_view ref, bool confirmed) const {
  const auto store = open_store();
  const RepoLock lock{store.lock_file(), store.settings()};
  const auto state = store.read_all();

  const auto target = resolve(state.log, ref);
  const bool is_head = target.is_last(state.log);
  if (!is_head && !confirmed) {
    throw Error(ErrorCode::NotConfirmed,
                "checkout of " + target.commit.hash +
                    " discards uncommitted changes to tracked files; confirmation required");
  }

  (void)worktree::restore(store, state.tracked, target.commit.hash);
  store.write_head(is_head);
  return CheckoutResult{.hash = target.commit.hash, .is_head = is_head};
}

void Repository::reset(std::string_view ref, bool confirmed) const {
  const auto store = open_store();
  const RepoLock lock{store.lock_file(), store.settings()};
  require_head(store, "reset");
  const auto state = store.read_all();

  const auto target = resolve(state.log, ref);
  if (!confirmed) {
    throw Error(ErrorCode::NotConfirmed, "reset to " + target.commit.hash +
                                             " permanently drops later commits; "
                                             "confirmation required");
  }

  (void)worktree::restore(store, state.tracked, target.commit.hash);

  const auto keep = static_cast<std::ptrdiff_t>(target.index + 1);
  const CommitLog kept(state.log.begin(), state.log.begin() + keep);
  const CommitLog dropped(state.log.begin() + keep, state.log.end());
  store.write_log(kept);

  // Tracked shrinks to every path some kept snapshot holds, so a later
  // checkout of any of them still clears the others' files.
  TrackedSet tracked;
  for (const auto &c : kept) {
    worktree::PathSet files;
    worktree::enumerate_paths(store.snapshot_dir(c.hash), files);
    for (const auto &rel : files) {
      tracked.insert(root_ / stdfs::path(rel));
    }
  }
  store.write_tracked(tracked);
  store.write_head(true);

  for (const auto &c : dropped) {
    store.remove_snapshot(c.hash);
  }
}

} // namespace snapvc
