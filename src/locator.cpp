#include "snapvc/locator.hpp"

#include "snapvc/consts.hpp"

#include <system_error>
#include <utility>

namespace snapvc {

auto discover_root(const std::filesystem::path &start) -> std::optional<std::filesystem::path> {
  std::error_code ec;
  auto dir = std::filesystem::absolute(start, ec).lexically_normal();
  if (ec)
    return std::nullopt;
  if (dir.filename().empty() && dir.has_relative_path())
    dir = dir.parent_path(); // "/a/b/" -> "/a/b"
  while (true) {
    if (std::filesystem::is_directory(dir / consts::kMetaDir, ec))
      return dir;
    if (!dir.has_relative_path())
      return std::nullopt; // reached "/"
    auto parent = dir.parent_path();
    if (parent == dir)
      return std::nullopt;
    dir = std::move(parent);
  }
}

} // namespace snapvc
