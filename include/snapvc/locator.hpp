#pragma once
#include <filesystem>
#include <optional>

namespace snapvc {

// Walk from `start` up to the filesystem root and return the first directory
// that contains a .snapvc directory.
auto discover_root(const std::filesystem::path& start) -> std::optional<std::filesystem::path>;

} // namespace snapvc
