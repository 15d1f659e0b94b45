#include "snapvc/fs.hpp"

#include "snapvc/error.hpp"

#include <array>
#include <cerrno>
#include <fstream>
#include <random>

namespace snapvc::fs {

namespace {

[[noreturn]] void throw_fs_error(const std::string &what, const std::filesystem::path &p,
                                 const std::error_code &ec) {
  const std::string msg = what + ": " + p.string() + ": " + ec.message();
  throw Error(is_transient(ec) ? ErrorCode::TransientIOError : ErrorCode::IOFailure, msg);
}

// errno left by a failed stream operation; EIO when the stream set none.
std::error_code last_stream_error() {
  const int err = errno;
  return {err != 0 ? err : EIO, std::generic_category()};
}

} // namespace

bool exists(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::exists(p, ec);
}

bool is_file(const std::filesystem::path &p) {
  std::error_code ec;
  return std::filesystem::is_regular_file(p, ec);
}

void ensure_dir(const std::filesystem::path &p) {
  std::error_code ec;
  std::filesystem::create_directories(p, ec);
  if (ec)
    throw_fs_error("mkdir -p failed", p, ec);
}

void ensure_parent_dir(const std::filesystem::path &p) { ensure_dir(p.parent_path()); }

std::vector<std::uint8_t> read_file(const std::filesystem::path &p) {
  errno = 0;
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs)
    throw_fs_error("open for read failed", p, last_stream_error());
  ifs.seekg(0, std::ios::end);
  const auto end = ifs.tellg();
  if (end < 0)
    throw_fs_error("read failed", p, last_stream_error());
  const auto n = static_cast<std::size_t>(end);
  ifs.seekg(0);
  std::vector<std::uint8_t> buf(n);
  if (n)
    ifs.read(reinterpret_cast<char *>(buf.data()), static_cast<std::streamsize>(n));
  if (!ifs)
    throw_fs_error("read failed", p, last_stream_error());
  return buf;
}

std::string read_text(const std::filesystem::path &p) {
  const auto bytes = read_file(p);
  return {bytes.begin(), bytes.end()};
}

void require_readable(const std::filesystem::path &p) {
  errno = 0;
  std::ifstream ifs(p, std::ios::binary);
  if (!ifs)
    throw_fs_error("open for read failed", p, last_stream_error());
}

void write_file_atomic(const std::filesystem::path &p, std::span<const std::uint8_t> data) {
  ensure_parent_dir(p);
  auto tmp = p;
  tmp += ".tmp-" + random_suffix();
  {
    std::ofstream ofs(tmp, std::ios::binary | std::ios::trunc);
    if (!ofs) {
      throw Error(ErrorCode::IOFailure, "open temp for write failed: " + tmp.string());
    }
    if (!data.empty()) {
      ofs.write(reinterpret_cast<const char *>(data.data()),
                static_cast<std::streamsize>(data.size()));
    }
    ofs.flush();
    if (!ofs) {
      ofs.close();
      std::error_code ignored;
      std::filesystem::remove(tmp, ignored);
      throw Error(ErrorCode::IOFailure, "flush temp failed: " + tmp.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, p, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    throw_fs_error("atomic replace failed", p, ec);
  }
}

void write_text_atomic(const std::filesystem::path &p, std::string_view text) {
  write_file_atomic(
      p, std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t *>(text.data()),
                                       text.size()));
}

void copy_file(const std::filesystem::path &from, const std::filesystem::path &to) {
  if (!is_file(from))
    throw Error(ErrorCode::FileNotFound, "no such file: " + from.string());
  ensure_parent_dir(to);
  std::error_code ec;
  std::filesystem::copy_file(from, to, std::filesystem::copy_options::overwrite_existing, ec);
  if (ec)
    throw_fs_error("copy to " + to.string() + " failed", from, ec);
}

bool is_transient(const std::error_code &ec) {
  return ec == std::errc::permission_denied || ec == std::errc::resource_unavailable_try_again ||
         ec == std::errc::device_or_resource_busy || ec == std::errc::text_file_busy ||
         ec == std::errc::interrupted;
}

std::string random_suffix() {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  thread_local std::mt19937_64 gen{std::random_device{}()};
  auto v = gen();
  std::string s(16, '0');
  for (auto &c : s) {
    c = kHex[v & 0xF];
    v >>= 4;
  }
  return s;
}

} // namespace snapvc::fs
