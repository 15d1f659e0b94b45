#include "snapvc/snapshot.hpp"

#include "snapvc/error.hpp"
#include "snapvc/fs.hpp"
#include "snapvc/hash.hpp"
#include "snapvc/worktree.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>

namespace stdfs = std::filesystem;

namespace snapvc::snapshot {

namespace {

bool in_log(const CommitLog &log, const std::string &hash) {
  return std::ranges::any_of(log, [&](const Commit &c) { return c.hash == hash; });
}

// SHA-1 over the parent id, the message, then each file's path, size and
// bytes in path order.
std::string content_hash(const StateStore &store, const stdfs::path &tree, const CommitLog &log,
                         std::string_view message) {
  Sha1 h;
  h.update("parent ");
  h.update(log.empty() ? std::string_view{} : std::string_view{log.back().hash});
  h.update("\nmessage " + std::to_string(message.size()) + "\n");
  h.update(message);

  worktree::PathSet files;
  worktree::enumerate_paths(tree, files);
  for (const auto &rel : files) {
    const auto bytes = store.with_io_retry([&] { return fs::read_file(tree / rel); });
    h.update("\nfile ");
    h.update(rel);
    h.update(" " + std::to_string(bytes.size()) + "\n");
    h.update(bytes);
  }
  return to_hex(h.finish());
}

std::string time_hash(const CommitLog &log) {
  while (true) {
    const auto now = std::chrono::system_clock::now().time_since_epoch();
    const auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(now).count();
    auto hex = to_hex(sha1(std::to_string(ns)));
    if (!in_log(log, hex))
      return hex;
  }
}

// Move the assembled tree into commits/<hash>. A directory already there but
// absent from the log is debris from a reset or an interrupted commit.
void publish(const StateStore &store, const stdfs::path &tmp, const std::string &hash,
             const CommitLog &log) {
  if (in_log(log, hash)) {
    throw Error(ErrorCode::ConsistencyFault, "commit " + hash + " already exists in history");
  }
  const auto dest = store.snapshot_dir(hash);
  if (fs::exists(dest))
    store.remove_snapshot(hash);
  std::error_code ec;
  stdfs::rename(tmp, dest, ec);
  if (ec) {
    throw Error(fs::is_transient(ec) ? ErrorCode::TransientIOError : ErrorCode::IOFailure,
                "cannot publish snapshot " + hash + ": " + ec.message());
  }
}

} // namespace

auto find_deletions(const TrackedSet &tracked) -> std::set<stdfs::path> {
  std::set<stdfs::path> out;
  for (const auto &p : tracked) {
    if (!fs::is_file(p))
      out.insert(p);
  }
  return out;
}

auto nothing_to_commit(const RepositoryState &state) -> bool {
  return state.staged.empty() && find_deletions(state.tracked).empty();
}

auto commit(const StateStore &store, const RepositoryState &state, std::string_view message)
    -> CommitResult {
  const auto deletions = find_deletions(state.tracked);
  if (state.staged.empty() && deletions.empty()) {
    throw Error(ErrorCode::NothingToCommit, "nothing to commit (no staged files or deletions)");
  }
  for (const auto &p : state.staged) {
    if (!fs::is_file(p))
      throw Error(ErrorCode::FileNotFound, "staged file no longer exists: " + p.string());
  }

  store.sweep_temp_snapshots();
  const auto &root = store.root();
  const auto tmp = store.commits_dir() / (std::string(consts::kTempPrefix) + fs::random_suffix());
  fs::ensure_dir(tmp);

  CommitResult result;
  try {
    for (const auto &p : state.staged) {
      const auto dest = tmp / worktree::relative_to_root(root, p);
      store.with_io_retry([&] { fs::copy_file(p, dest); });
    }

    if (!state.log.empty()) {
      const auto &prev_hash = state.log.back().hash;
      const auto prev = store.snapshot_dir(prev_hash);
      const std::set<stdfs::path> staged(state.staged.begin(), state.staged.end());
      for (const auto &p : state.tracked) {
        if (staged.contains(p) || deletions.contains(p))
          continue;
        const auto rel = p.lexically_relative(root);
        if (!fs::is_file(prev / rel)) {
          result.warnings.push_back(std::string(to_string(ErrorCode::ConsistencyFault)) +
                                    ": tracked file " + rel.generic_string() +
                                    " is missing from snapshot " + prev_hash + "; skipped");
          continue;
        }
        store.with_io_retry([&] { fs::copy_file(prev / rel, tmp / rel); });
      }
    }

    result.hash = store.settings().hash_scheme == HashScheme::Time
                      ? time_hash(state.log)
                      : content_hash(store, tmp, state.log, message);
    publish(store, tmp, result.hash, state.log);
  } catch (...) {
    std::error_code ignored;
    stdfs::remove_all(tmp, ignored);
    throw;
  }

  // The log append is the commit point; tracked and staged follow it.
  auto log = state.log;
  log.push_back(Commit{.hash = result.hash, .message = std::string(message)});
  store.write_log(log);

  auto tracked = state.tracked;
  tracked.insert(state.staged.begin(), state.staged.end());
  store.write_tracked(tracked);
  store.write_staged({});

  return result;
}

} // namespace snapvc::snapshot
