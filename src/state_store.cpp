#include "snapvc/state_store.hpp"

#include "snapvc/error.hpp"
#include "snapvc/fs.hpp"
#include "snapvc/hash.hpp"

#include <charconv>
#include <sstream>
#include <string_view>
#include <system_error>
#include <utility>

namespace snapvc {

namespace {

[[noreturn]] void corrupt(std::string_view file, std::string_view why) {
  throw Error(ErrorCode::NotARepository,
              "corrupt state file '" + std::string(file) + "': " + std::string(why));
}

std::vector<std::filesystem::path> parse_path_lines(std::string_view file, const std::string &text) {
  std::vector<std::filesystem::path> out;
  std::istringstream is(text);
  std::string line;
  while (std::getline(is, line)) {
    if (line.empty())
      continue;
    std::filesystem::path p{line};
    if (!p.is_absolute())
      corrupt(file, "relative path '" + line + "'");
    out.push_back(std::move(p));
  }
  return out;
}

template <class Paths> std::string format_path_lines(const Paths &paths) {
  std::string out;
  for (const auto &p : paths) {
    const std::string s = p.string();
    if (s.find(consts::kLF) != std::string::npos)
      throw Error(ErrorCode::IOFailure, "path contains a newline: " + s);
    out += s;
    out += consts::kLF;
  }
  return out;
}

} // namespace

StateStore::StateStore(std::filesystem::path repo_root, Settings settings)
    : root_(std::move(repo_root)), settings_(settings) {}

auto StateStore::is_initialized() const -> bool {
  return fs::is_file(state_file(consts::kStatusFile));
}

void StateStore::require_initialized() const {
  if (!is_initialized()) {
    throw Error(ErrorCode::NotARepository,
                "not a snapvc repository (missing " + meta_dir().string() + ")");
  }
}

void StateStore::create() const {
  std::error_code ec;
  if (std::filesystem::exists(meta_dir(), ec)) {
    if (!std::filesystem::is_directory(meta_dir(), ec) ||
        !std::filesystem::is_empty(meta_dir(), ec) || ec) {
      throw Error(ErrorCode::IOFailure, meta_dir().string() +
                                            " exists but is not an empty directory; "
                                            "refusing to initialize over it");
    }
  }
  fs::ensure_dir(commits_dir());
  save_settings(root_, settings_);
  write_staged({});
  write_tracked({});
  write_log({});
  // status goes last: its presence marks the repository as initialized
  write_head(true);
}

auto StateStore::read_state_file(std::string_view name) const -> std::string {
  require_initialized();
  const auto p = state_file(name);
  if (!fs::is_file(p))
    corrupt(name, "missing");
  return with_io_retry([&] { return fs::read_text(p); });
}

void StateStore::write_state_file(std::string_view name, const std::string &text) const {
  with_io_retry([&] { fs::write_text_atomic(state_file(name), text); });
}

auto StateStore::read_staged() const -> StagedSet {
  return parse_path_lines(consts::kStagedFile, read_state_file(consts::kStagedFile));
}

void StateStore::write_staged(const StagedSet &staged) const {
  write_state_file(consts::kStagedFile, format_path_lines(staged));
}

auto StateStore::read_tracked() const -> TrackedSet {
  const auto paths = parse_path_lines(consts::kTrackedFile, read_state_file(consts::kTrackedFile));
  return {paths.begin(), paths.end()};
}

void StateStore::write_tracked(const TrackedSet &tracked) const {
  write_state_file(consts::kTrackedFile, format_path_lines(tracked));
}

// history format, one record per commit:
//   "commit <40-hex> <message-length>\n<message bytes>\n"
auto StateStore::read_log() const -> CommitLog {
  const std::string text = read_state_file(consts::kHistoryFile);
  const std::string_view file = consts::kHistoryFile;

  CommitLog log;
  std::size_t pos = 0;
  while (pos < text.size()) {
    const auto nl = text.find(consts::kLF, pos);
    if (nl == std::string::npos)
      corrupt(file, "truncated record header");
    const std::string_view header(text.data() + pos, nl - pos);
    if (!header.starts_with(consts::kCommitPrefix))
      corrupt(file, "expected 'commit' record");

    const auto rest = header.substr(consts::kCommitPrefix.size());
    const auto sp = rest.find(consts::kSpace);
    if (sp != consts::kHashHexLen || !is_hex(rest.substr(0, sp)))
      corrupt(file, "bad commit hash");
    Commit c;
    c.hash = ascii_lower(rest.substr(0, sp));

    const auto len_str = rest.substr(sp + 1);
    std::size_t len = 0;
    const auto [ptr, ec] = std::from_chars(len_str.data(), len_str.data() + len_str.size(), len);
    if (ec != std::errc{} || ptr != len_str.data() + len_str.size())
      corrupt(file, "bad message length for " + c.hash);

    pos = nl + 1;
    if (text.size() - pos < len + 1 || text[pos + len] != consts::kLF)
      corrupt(file, "truncated message for " + c.hash);
    c.message = text.substr(pos, len);
    pos += len + 1;

    log.push_back(std::move(c));
  }
  return log;
}

void StateStore::write_log(const CommitLog &log) const {
  std::string out;
  for (const auto &c : log) {
    out += consts::kCommitPrefix;
    out += c.hash;
    out += consts::kSpace;
    out += std::to_string(c.message.size());
    out += consts::kLF;
    out += c.message;
    out += consts::kLF;
  }
  write_state_file(consts::kHistoryFile, out);
}

auto StateStore::read_head() const -> bool {
  std::string text = read_state_file(consts::kStatusFile);
  while (!text.empty() && (text.back() == '\n' || text.back() == '\r'))
    text.pop_back();
  if (!text.starts_with(consts::kHeadPrefix))
    corrupt(consts::kStatusFile, "expected 'head:'");
  const auto value = std::string_view(text).substr(consts::kHeadPrefix.size());
  if (value == "true")
    return true;
  if (value == "false")
    return false;
  corrupt(consts::kStatusFile, "head must be true or false");
}

void StateStore::write_head(bool head) const {
  write_state_file(consts::kStatusFile,
                   std::string(consts::kHeadPrefix) + (head ? "true" : "false") + "\n");
}

auto StateStore::read_all() const -> RepositoryState {
  RepositoryState st;
  st.staged = read_staged();
  st.tracked = read_tracked();
  st.log = read_log();
  st.head = read_head();
  return st;
}

void StateStore::remove_snapshot(const std::string &hash) const {
  std::error_code ec;
  std::filesystem::remove_all(snapshot_dir(hash), ec);
  if (ec) {
    throw Error(ErrorCode::IOFailure,
                "cannot remove snapshot " + hash + ": " + ec.message());
  }
}

void StateStore::sweep_temp_snapshots() const {
  std::error_code ec;
  std::vector<std::filesystem::path> stale;
  for (auto it = std::filesystem::directory_iterator(commits_dir(), ec);
       !ec && it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (it->path().filename().string().starts_with(consts::kTempPrefix))
      stale.push_back(it->path());
  }
  if (ec) {
    throw Error(ErrorCode::IOFailure,
                "cannot list " + commits_dir().string() + ": " + ec.message());
  }
  for (const auto &p : stale) {
    std::filesystem::remove_all(p, ec);
    if (ec) {
      throw Error(ErrorCode::IOFailure, "cannot remove " + p.string() + ": " + ec.message());
    }
  }
}

} // namespace snapvc
