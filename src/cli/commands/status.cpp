#include "cli/common.hpp"
#include "snapvc/repo.hpp"

#include <iostream>
#include <string>

int cmd_status(int /*argc*/, char ** /*argv*/) {
  auto repo = snapvc::cli::open_repo("status");
  if (!repo)
    return 1;

  try {
    const auto st = repo->status();
    std::cout << "Status of repository at " << repo->root().string() << ":\n";

    const auto n = st.staged.size();
    std::cout << (n == 0 ? std::string("No") : std::to_string(n)) << " file"
              << (n == 1 ? "" : "s") << " staged for commit" << (n ? ":" : ".") << "\n";
    for (const auto &p : st.staged) {
      std::cout << "  - " << p.lexically_relative(repo->root()).generic_string() << "\n";
    }
    std::cout << st.tracked << " tracked, " << st.commits << " commit"
              << (st.commits == 1 ? "" : "s") << "\n";

    if (st.head)
      std::cout << "HEAD is checked out.\n";
    else
      std::cout << "HEAD is not checked out; add, remove, commit and reset are unavailable\n";
    return 0;
  } catch (const std::exception &e) {
    return snapvc::cli::report("status", e);
  }
}
