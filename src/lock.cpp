#include "snapvc/lock.hpp"

#include "snapvc/error.hpp"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <fcntl.h>
#include <sys/file.h>
#include <system_error>
#include <thread>
#include <unistd.h>

namespace snapvc {

namespace {
constexpr int kMaxBackoffMs = 200;
}

RepoLock::RepoLock(const std::filesystem::path &lock_file, const Settings &settings) {
  do {
    fd_ = ::open(lock_file.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  } while (fd_ < 0 && errno == EINTR);
  if (fd_ < 0) {
    const std::error_code ec(errno, std::generic_category());
    throw Error(ErrorCode::NotARepository,
                "cannot open lock file " + lock_file.string() + ": " + ec.message());
  }

  int backoff_ms = settings.lock_backoff_ms;
  for (int attempt = 1;; ++attempt) {
    if (::flock(fd_, LOCK_EX | LOCK_NB) == 0)
      return;
    const int err = errno;
    if (err != EWOULDBLOCK && err != EINTR) {
      ::close(fd_);
      const std::error_code ec(err, std::generic_category());
      throw Error(ErrorCode::IOFailure, "flock " + lock_file.string() + ": " + ec.message());
    }
    if (attempt >= settings.lock_retries) {
      ::close(fd_);
      throw Error(ErrorCode::TransientIOError,
                  "repository is locked by another process: " + lock_file.string());
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
    backoff_ms = std::min(std::max(backoff_ms * 2, 1), kMaxBackoffMs);
  }
}

RepoLock::~RepoLock() {
  if (fd_ >= 0) {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }
}

} // namespace snapvc
