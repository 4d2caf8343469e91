#pragma once

#include <string>
#include <vector>

// A command line split into its name and decoded arguments.
struct ParsedCommand {
  std::string name;
  std::vector<std::string> args;

  bool empty() const { return name.empty(); }
};

// Percent-encodes control bytes, space, '%', DEL and every non-ASCII byte.
std::string encode_arg(const std::string& raw);

// Never fails: malformed escapes stay literal, invalid UTF-8 becomes U+FFFD.
std::string decode_arg(const std::string& encoded);

// Replaces each invalid UTF-8 sequence with U+FFFD.
std::string sanitize_utf8(const std::string& bytes);

ParsedCommand parse_command(const std::string& line);
std::string format_command(const std::string& name,
                           const std::vector<std::string>& args = {});
