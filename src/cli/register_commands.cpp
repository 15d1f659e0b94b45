#include "cli/registry.hpp"

int cmd_init(int argc, char **argv);
int cmd_add(int argc, char **argv);
int cmd_remove(int argc, char **argv);
int cmd_commit(int argc, char **argv);
int cmd_status(int, char **);
int cmd_checkout(int, char **);
int cmd_reset(int, char **);
int cmd_log(int, char **);
int cmd_help(int, char **);

namespace snapvc::cli {

void register_all_commands() {
  register_command({.name = "init",
                    .fn = ::cmd_init,
                    .usage = "",
                    .summary = "Initialize a new repository in the current directory"});
  register_command({.name = "add",
                    .fn = ::cmd_add,
                    .usage = "<path>...",
                    .summary = "Stage files for the next commit"});
  register_command({.name = "remove",
                    .fn = ::cmd_remove,
                    .usage = "<path>",
                    .summary = "Unstage a file"});
  register_command({.name = "commit",
                    .fn = ::cmd_commit,
                    .usage = "[-m <message>]",
                    .summary = "Commit staged files (opens $VISUAL/$EDITOR without -m)"});
  register_command({.name = "log",
                    .fn = ::cmd_log,
                    .usage = "[--short | -s]",
                    .summary = "List commits, oldest first"});
  register_command({.name = "status",
                    .fn = ::cmd_status,
                    .usage = "",
                    .summary = "Show staged files and whether HEAD is checked out"});
  register_command({.name = "checkout",
                    .fn = ::cmd_checkout,
                    .usage = "<hash-prefix | HEAD> [-q | --quiet]",
                    .summary = "Restore the working tree to a commit"});
  register_command({.name = "reset",
                    .fn = ::cmd_reset,
                    .usage = "<hash-prefix | HEAD> [-y | --yes]",
                    .summary = "Restore a commit and drop every later one"});
  register_command({.name = "help",
                    .fn = ::cmd_help,
                    .usage = "[command]",
                    .summary = "Show help"});
}

} // namespace snapvc::cli
