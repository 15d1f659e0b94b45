#pragma once

namespace snapvc::cli {

// A subcommand handler receives argv starting at the subcommand name.
using command_fn = int (*)(int argc, char **argv);

} // namespace snapvc::cli
