#include "cli/editor.hpp"

#include "snapvc/consts.hpp"
#include "snapvc/fs.hpp"

#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>

namespace snapvc::cli {

namespace {

std::string editor_command() {
  for (const char *var : {"VISUAL", "EDITOR"}) {
    if (const char *v = std::getenv(var); v && *v)
      return v;
  }
  return "vi";
}

// Single-quote for /bin/sh
std::string shell_quote(const std::string &s) {
  std::string out = "'";
  for (char c : s) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += '\'';
  return out;
}

// Drop '#' comment lines and trailing blank lines
std::string clean_message(const std::string &raw) {
  std::istringstream is(raw);
  std::string line;
  std::string out;
  while (std::getline(is, line)) {
    if (!line.empty() && line[0] == '#')
      continue;
    out += line;
    out += '\n';
  }
  while (!out.empty() && (out.back() == '\n' || out.back() == ' '))
    out.pop_back();
  return out;
}

} // namespace

std::string EditorMessage::request_message() {
  const auto path = meta_dir_ / consts::kMessageFile;
  fs::write_text_atomic(path, "\n# Enter the commit message. Lines starting with '#' are ignored.\n");

  const std::string cmd = editor_command() + " " + shell_quote(path.string());
  const int rc = std::system(cmd.c_str());
  if (rc != 0) {
    std::error_code ignored;
    std::filesystem::remove(path, ignored);
    throw std::runtime_error("editor exited with status " + std::to_string(rc) + ": " + cmd);
  }

  const std::string message = clean_message(fs::read_text(path));
  std::error_code ignored;
  std::filesystem::remove(path, ignored);
  return message;
}

} // namespace snapvc::cli
