#pragma once
#include "snapvc/config.hpp"

#include <filesystem>

namespace snapvc {

// Exclusive advisory lock on .snapvc/lock, held for the object's lifetime.
// Serializes read-modify-write sequences across processes. Acquisition never
// blocks indefinitely: after settings.lock_retries failed attempts it throws
// Error(TransientIOError).
class RepoLock {
public:
  RepoLock(const std::filesystem::path& lock_file, const Settings& settings);
  ~RepoLock();
  RepoLock(const RepoLock&) = delete;
  RepoLock& operator=(const RepoLock&) = delete;

private:
  int fd_ = -1;
};

} // namespace snapvc
