#pragma once
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace snapvc {

enum class ErrorCode : std::uint8_t {
  NotARepository,
  RepositoryNotMutable,
  FileNotFound,
  PathOutsideRepository,
  AlreadyStaged,
  NotStaged,
  AmbiguousPrefix,
  NoSuchCommit,
  EmptyHistory,
  NothingToCommit,
  NotConfirmed,
  TransientIOError,
  ConsistencyFault,
  IOFailure,
};

// Stable name of an error code, e.g. "AmbiguousPrefix"
auto to_string(ErrorCode code) -> std::string_view;

/**
 * Every failure the library reports is an Error. The message always names the
 * offending path, hash or reference; code() lets callers branch on the kind.
 */
class Error : public std::runtime_error {
public:
  Error(ErrorCode code, const std::string &what) : std::runtime_error(what), code_(code) {}

  [[nodiscard]] ErrorCode code() const noexcept { return code_; }
  // TransientIOError is the only kind worth retrying
  [[nodiscard]] bool retryable() const noexcept { return code_ == ErrorCode::TransientIOError; }

private:
  ErrorCode code_;
};

} // namespace snapvc
