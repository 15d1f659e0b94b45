#include "snapvc/error.hpp"

namespace snapvc {

auto to_string(ErrorCode code) -> std::string_view {
  switch (code) {
  case ErrorCode::NotARepository:
    return "NotARepository";
  case ErrorCode::RepositoryNotMutable:
    return "RepositoryNotMutable";
  case ErrorCode::FileNotFound:
    return "FileNotFound";
  case ErrorCode::PathOutsideRepository:
    return "PathOutsideRepository";
  case ErrorCode::AlreadyStaged:
    return "AlreadyStaged";
  case ErrorCode::NotStaged:
    return "NotStaged";
  case ErrorCode::AmbiguousPrefix:
    return "AmbiguousPrefix";
  case ErrorCode::NoSuchCommit:
    return "NoSuchCommit";
  case ErrorCode::EmptyHistory:
    return "EmptyHistory";
  case ErrorCode::NothingToCommit:
    return "NothingToCommit";
  case ErrorCode::NotConfirmed:
    return "NotConfirmed";
  case ErrorCode::TransientIOError:
    return "TransientIOError";
  case ErrorCode::ConsistencyFault:
    return "ConsistencyFault";
  case ErrorCode::IOFailure:
    return "IOFailure";
  }
  return "Unknown";
}

} // namespace snapvc
