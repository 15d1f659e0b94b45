#pragma once
#include "snapvc/state_store.hpp"

#include <filesystem>
#include <set>
#include <string>

namespace snapvc {

namespace worktree {

using PathSet = std::set<std::string>; // generic relative paths, e.g. "dir/a.txt"

// Enumerate regular files under dir as relative paths, skipping every .snapvc
// directory. Throws Error(IOFailure) naming dir when it is missing or
// unreadable.
void enumerate_paths(const std::filesystem::path& dir, PathSet& out_paths);

// Path of `p` relative to root. Throws Error(PathOutsideRepository) when `p`
// escapes root or has a metadata directory component at any depth.
auto relative_to_root(const std::filesystem::path& root, const std::filesystem::path& p)
    -> std::filesystem::path;

// Replace the tracked part of the working tree with the snapshot `hash`:
// the snapshot is checked first, then tracked files are deleted, directories
// left empty by that are pruned, and the snapshot is copied in.
// Returns the snapshot's file list.
auto restore(const StateStore& store, const TrackedSet& tracked, const std::string& hash)
    -> PathSet;

} // namespace worktree

} // namespace snapvc
