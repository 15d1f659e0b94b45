#pragma once
#include "snapvc/state_store.hpp"

#include <cstddef>
#include <string_view>

namespace snapvc {

// Position of the resolved commit in the log, plus the record itself.
struct Resolved {
  std::size_t index;
  Commit commit;

  [[nodiscard]] bool is_last(const CommitLog& log) const { return index + 1 == log.size(); }
};

/**
 * Map a ref to exactly one commit.
 *  - "HEAD" (any case) is the last commit; Error(EmptyHistory) if there is none.
 *  - Otherwise `ref` is a case-insensitive hash prefix: no match is
 *    Error(NoSuchCommit), more than one is Error(AmbiguousPrefix).
 * An empty ref never matches.
 */
auto resolve(const CommitLog& log, std::string_view ref) -> Resolved;

} // namespace snapvc
