#pragma once
#include "snapvc/state_store.hpp"

#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace snapvc {

struct CommitResult {
  std::string hash;
  // One entry per consistency fault: a tracked file the previous snapshot
  // did not contain, so it was left out of this one.
  std::vector<std::string> warnings;
};

namespace snapshot {

// Tracked paths that are no longer regular files in the working tree
auto find_deletions(const TrackedSet& tracked) -> std::set<std::filesystem::path>;

// True when a commit would record nothing
auto nothing_to_commit(const RepositoryState& state) -> bool;

/**
 * Record a new commit from `state` (read under the repository lock):
 *  - staged files are copied from the working tree,
 *  - other tracked, non-deleted files are carried forward from the previous
 *    snapshot (never from the working tree),
 *  - the tree is assembled in a temp directory and renamed into place,
 *  - only then is the log appended, tracked grown and staged cleared.
 * Throws Error(NothingToCommit) or Error(FileNotFound) before touching
 * anything.
 */
auto commit(const StateStore& store, const RepositoryState& state, std::string_view message)
    -> CommitResult;

} // namespace snapshot

} // namespace snapvc
