#include "snapvc/config.hpp"

#include "snapvc/consts.hpp"
#include "snapvc/error.hpp"
#include "snapvc/fs.hpp"

#include <charconv>
#include <sstream>
#include <string_view>

namespace {

std::string trim(std::string_view sv) {
  // left trim spaces/tabs
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t'))
    sv.remove_prefix(1);
  // right trim spaces/tabs/CR
  while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    sv.remove_suffix(1);
  return std::string(sv);
}

int parse_count(std::string_view key, const std::string &value, int min) {
  int out = 0;
  const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
  if (ec != std::errc{} || ptr != value.data() + value.size() || out < min) {
    throw snapvc::Error(snapvc::ErrorCode::NotARepository,
                        "bad config value for " + std::string(key) + ": '" + value + "'");
  }
  return out;
}

} // namespace

namespace snapvc {

std::filesystem::path cfg_path(const std::filesystem::path &repo_root) {
  return repo_root / consts::kMetaDir / consts::kConfigFile;
}

auto to_string(HashScheme scheme) -> std::string_view {
  return scheme == HashScheme::Time ? "time" : "content";
}

auto load_settings(const std::filesystem::path &repo_root) -> Settings {
  Settings out{};
  const auto path = cfg_path(repo_root);
  if (!fs::exists(path))
    return out;

  const std::string text = fs::read_text(path);
  std::istringstream iss(text);

  std::string line;
  while (std::getline(iss, line)) {
    std::string_view sv{line};
    if (sv.empty() || sv[0] == '#')
      continue; // allow comments
    const auto colon = sv.find(':');
    if (colon == std::string_view::npos)
      continue;
    const std::string key = trim(sv.substr(0, colon));
    const std::string value = trim(sv.substr(colon + 1));

    if (key == "lock-retries") {
      out.lock_retries = parse_count(key, value, 1);
    } else if (key == "lock-backoff-ms") {
      out.lock_backoff_ms = parse_count(key, value, 0);
    } else if (key == "io-retries") {
      out.io_retries = parse_count(key, value, 1);
    } else if (key == "hash-scheme") {
      if (value == "content")
        out.hash_scheme = HashScheme::Content;
      else if (value == "time")
        out.hash_scheme = HashScheme::Time;
      else
        throw Error(ErrorCode::NotARepository, "bad config value for hash-scheme: '" + value + "'");
    }
  }
  return out;
}

void save_settings(const std::filesystem::path &repo_root, const Settings &settings) {
  std::ostringstream os;
  os << "lock-retries: " << settings.lock_retries << '\n'
     << "lock-backoff-ms: " << settings.lock_backoff_ms << '\n'
     << "io-retries: " << settings.io_retries << '\n'
     << "hash-scheme: " << to_string(settings.hash_scheme) << '\n';
  fs::write_text_atomic(cfg_path(repo_root), os.str());
}

} // namespace snapvc
