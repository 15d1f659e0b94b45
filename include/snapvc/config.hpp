#pragma once
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace snapvc {

enum class HashScheme : std::uint8_t {
  Content, // SHA-1 over parent, message and every snapshot file
  Time,    // SHA-1 over the current time (the historical scheme)
};

struct Settings {
  int lock_retries = 20;
  int lock_backoff_ms = 5;
  int io_retries = 3;
  HashScheme hash_scheme = HashScheme::Content;
};

auto to_string(HashScheme scheme) -> std::string_view;

// Read settings from .snapvc/config (defaults for missing file or keys).
// Throws Error(NotARepository) on a malformed value, naming the key.
Settings load_settings(const std::filesystem::path& repo_root);

// Overwrite .snapvc/config with the given settings
void save_settings(const std::filesystem::path& repo_root, const Settings& settings);

} // namespace snapvc
