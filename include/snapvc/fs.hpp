#pragma once
#include "snapvc/error.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace snapvc::fs {

bool exists(const std::filesystem::path& p);
bool is_file(const std::filesystem::path& p);
void ensure_dir(const std::filesystem::path& p);
void ensure_parent_dir(const std::filesystem::path& p);

// Open and read failures are TransientIOError when the cause may clear up
// (see is_transient), IOFailure otherwise.
std::vector<std::uint8_t> read_file(const std::filesystem::path& p);
std::string read_text(const std::filesystem::path& p);

// Throws like read_file when `p` cannot be opened for reading.
void require_readable(const std::filesystem::path& p);

// Write to a uniquely named sibling temp file, then rename over `p`.
// Readers see either the old or the new content, never a mix.
void write_file_atomic(const std::filesystem::path& p, std::span<const std::uint8_t> data);
void write_text_atomic(const std::filesystem::path& p, std::string_view text);

// Copy a regular file, creating parent directories of `to` as needed.
void copy_file(const std::filesystem::path& from, const std::filesystem::path& to);

// Errors that may clear up on their own (permission races, busy files)
bool is_transient(const std::error_code& ec);

inline constexpr int kMaxRetryBackoffMs = 200;

// Retry `fn` while it throws a transient Error, sleeping backoff_ms, then
// twice that, up to kMaxRetryBackoffMs per wait. The last failure propagates.
template <class Fn>
auto with_retry(int attempts, int backoff_ms, Fn&& fn) -> decltype(fn()) {
  backoff_ms = std::clamp(backoff_ms, 0, kMaxRetryBackoffMs);
  for (int attempt = 1;; ++attempt) {
    try {
      return fn();
    } catch (const Error& e) {
      if (!e.retryable() || attempt >= attempts)
        throw;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
    backoff_ms = std::min(std::max(backoff_ms * 2, 1), kMaxRetryBackoffMs);
  }
}

// Random lowercase hex suffix for temp names
std::string random_suffix();

} // namespace snapvc::fs
