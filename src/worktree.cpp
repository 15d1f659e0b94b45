#include "snapvc/worktree.hpp"

#include "snapvc/consts.hpp"
#include "snapvc/error.hpp"
#include "snapvc/fs.hpp"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <string>
#include <vector>

namespace stdfs = std::filesystem;

namespace snapvc::worktree {

void enumerate_paths(const stdfs::path &dir, PathSet &out_paths) {
  std::error_code ec;
  if (!stdfs::is_directory(dir, ec)) {
    throw Error(ErrorCode::IOFailure, "snapshot directory missing: " + dir.string());
  }
  auto it = stdfs::recursive_directory_iterator(dir, ec);
  for (; !ec && it != stdfs::recursive_directory_iterator(); it.increment(ec)) {
    const auto &p = it->path();
    if (p.filename() == consts::kMetaDir) {
      it.disable_recursion_pending();
      continue;
    }
    if (!it->is_regular_file(ec)) {
      continue;
    }
    out_paths.insert(p.lexically_relative(dir).generic_string());
  }
  if (ec) {
    throw Error(ErrorCode::IOFailure, "cannot list " + dir.string() + ": " + ec.message());
  }
}

auto relative_to_root(const stdfs::path &root, const stdfs::path &p) -> stdfs::path {
  const auto abs = (p.is_absolute() ? p : root / p).lexically_normal();
  const auto rel = abs.lexically_relative(root);
  const auto first = rel.begin();
  if (rel.empty() || first == rel.end() || *first == ".." || *first == ".") {
    throw Error(ErrorCode::PathOutsideRepository,
                abs.string() + " is outside repository " + root.string());
  }
  // enumerate_paths never descends into a metadata directory, at any depth
  if (std::find(rel.begin(), rel.end(), stdfs::path(consts::kMetaDir)) != rel.end()) {
    throw Error(ErrorCode::PathOutsideRepository,
                abs.string() + " is inside a " + std::string(consts::kMetaDir) + " directory");
  }
  return rel;
}

namespace {

// Every directory strictly between root and a tracked file, deepest first.
std::vector<stdfs::path> tracked_dirs(const stdfs::path &root, const TrackedSet &tracked) {
  std::set<stdfs::path> dirs;
  for (const auto &p : tracked) {
    const auto rel = p.lexically_relative(root);
    if (rel.empty() || *rel.begin() == "..")
      continue;
    for (auto d = rel.parent_path(); !d.empty(); d = d.parent_path())
      dirs.insert(root / d);
  }
  std::vector<stdfs::path> out(dirs.begin(), dirs.end());
  std::ranges::sort(out, [](const stdfs::path &a, const stdfs::path &b) {
    return std::distance(a.begin(), a.end()) > std::distance(b.begin(), b.end());
  });
  return out;
}

void check_readable(const StateStore &store, const stdfs::path &snap, const PathSet &files) {
  for (const auto &rel : files) {
    store.with_io_retry([&] { fs::require_readable(snap / rel); });
  }
}

} // namespace

auto restore(const StateStore &store, const TrackedSet &tracked, const std::string &hash)
    -> PathSet {
  const auto &root = store.root();
  const auto snap = store.snapshot_dir(hash);

  // Nothing in the working tree changes until the snapshot is known good
  PathSet files;
  enumerate_paths(snap, files);
  check_readable(store, snap, files);

  for (const auto &p : tracked) {
    std::error_code ec;
    stdfs::remove(p, ec);
    if (ec && ec != std::errc::no_such_file_or_directory)
      throw Error(ErrorCode::IOFailure, "cannot remove " + p.string() + ": " + ec.message());
  }

  // Directories that held only tracked files are empty now; anything else
  // still has content and rmdir fails, which is fine.
  for (const auto &dir : tracked_dirs(root, tracked)) {
    std::error_code ignored;
    stdfs::remove(dir, ignored);
  }

  for (const auto &rel : files) {
    store.with_io_retry([&] { fs::copy_file(snap / rel, root / rel); });
  }
  return files;
}

} // namespace snapvc::worktree
