#include "snapvc/resolver.hpp"

#include "snapvc/consts.hpp"
#include "snapvc/error.hpp"
#include "snapvc/hash.hpp"

#include <optional>
#include <string>

namespace snapvc {

auto resolve(const CommitLog &log, std::string_view ref) -> Resolved {
  if (ascii_lower(ref) == ascii_lower(consts::kHeadRef)) {
    if (log.empty())
      throw Error(ErrorCode::EmptyHistory, "HEAD does not name a commit: history is empty");
    return Resolved{.index = log.size() - 1, .commit = log.back()};
  }

  if (ref.empty())
    throw Error(ErrorCode::NoSuchCommit, "empty commit reference");

  const std::string prefix = ascii_lower(ref);
  std::optional<std::size_t> found;
  for (std::size_t i = 0; i < log.size(); ++i) {
    if (!log[i].hash.starts_with(prefix))
      continue;
    if (found) {
      throw Error(ErrorCode::AmbiguousPrefix,
                  "'" + std::string(ref) + "' is ambiguous; use a longer hash prefix");
    }
    found = i;
  }
  if (!found)
    throw Error(ErrorCode::NoSuchCommit, "'" + std::string(ref) + "' does not name a commit");
  return Resolved{.index = *found, .commit = log[*found]};
}

} // namespace snapvc
