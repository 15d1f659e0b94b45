#include "cli/common.hpp"
#include "cli/editor.hpp"
#include "snapvc/error.hpp"
#include "snapvc/repo.hpp"

#include <iostream>
#include <optional>
#include <string>

int cmd_commit(int argc, char **argv) {
  // very small parser: snapvc commit [-m "msg"]
  std::optional<std::string> message;
  for (int i = 1; i < argc; ++i) {
    if (std::string a = argv[i]; (a == "-m" || a == "--message") && i + 1 < argc) {
      message = argv[++i];
    } else {
      std::cerr << "usage: snapvc commit [-m <message>]\n";
      return 2;
    }
  }

  auto repo = snapvc::cli::open_repo("commit");
  if (!repo)
    return 1;

  try {
    snapvc::CommitResult result;
    if (message) {
      result = repo->commit(*message);
    } else {
      std::cout << "Opening editor to enter commit message...\n";
      snapvc::cli::EditorMessage editor{repo->meta_dir()};
      result = repo->commit(editor);
    }
    for (const auto &w : result.warnings) {
      std::cerr << "warning: " << w << "\n";
    }
    std::cout << "Commit hash: " << result.hash << "\n";
    return 0;
  } catch (const snapvc::Error &e) {
    if (e.code() == snapvc::ErrorCode::NothingToCommit) {
      std::cout << e.what() << "\n";
      return 1;
    }
    return snapvc::cli::report("commit", e);
  } catch (const std::exception &e) {
    return snapvc::cli::report("commit", e);
  }
}
