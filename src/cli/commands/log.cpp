#include "cli/common.hpp"
#include "snapvc/repo.hpp"

#include <iostream>
#include <string>

int cmd_log(int argc, char **argv) {
  bool short_form = false;
  for (int i = 1; i < argc; ++i) {
    const std::string a = argv[i];
    if (a == "--short" || a == "-s") {
      short_form = true;
    } else {
      std::cerr << "usage: snapvc log [--short | -s]\n";
      return 2;
    }
  }

  auto repo = snapvc::cli::open_repo("log");
  if (!repo)
    return 1;
  try {
    const auto log = repo->log(short_form ? snapvc::LogFormat::Short : snapvc::LogFormat::Full);
    std::cout << log.size() << " commit" << (log.size() == 1 ? "" : "s") << "\n";
    if (!log.empty())
      std::cout << "\n";

    for (std::size_t i = 0; i < log.size(); ++i) {
      const auto &c = log[i];
      if (short_form) {
        std::cout << c.hash << " " << c.message << "\n";
        continue;
      }
      std::cout << "commit " << c.hash << "\n\n" << c.message << "\n";
      if (i + 1 < log.size())
        std::cout << "\n---\n\n";
    }
    return 0;
  } catch (const std::exception &e) {
    return snapvc::cli::report("log", e);
  }
}
