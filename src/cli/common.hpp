#pragma once
#include "snapvc/repo.hpp"

#include <exception>
#include <optional>
#include <string>
#include <string_view>

namespace snapvc::cli {

// Locate the repository containing the current directory; prints
// "<cmd>: not a snapvc repo" and returns nullopt when there is none.
std::optional<Repository> open_repo(std::string_view cmd);

// Ask a y/N question on the terminal; anything but y/Y is no.
bool confirm(std::string_view question);

// Report a library error the way every command does
int report(std::string_view cmd, const std::exception &e);

} // namespace snapvc::cli
