#pragma once

#include <memory>
#include <mutex>
#include <ostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "log.hpp"
#include "path_codec.hpp"

// protocol.hpp
inline constexpr const char* kProtocolVersion = "1";

// Wrong or missing VERSION exchange.
class HandshakeError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Command not valid in the current state, or missing its arguments.
class ProtocolError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Filesystem feature the bridge refuses to handle (symbolic links).
class UnsupportedError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Watch registration failure or an error reported by the watcher.
class WatchError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class CommandKind {
  Version,
  Start,
  Dir,
  Link,
  Done,
  Wait,
  Changes,
  Reset,
  Debug,
  Unknown
};

struct Command {
  CommandKind kind = CommandKind::Unknown;
  std::string name;
  std::vector<std::string> args;

  // Throws ProtocolError when fewer than index+1 arguments were sent.
  const std::string& arg(std::size_t index) const;
};

CommandKind command_kind_from_name(const std::string& name);
const char* command_name(CommandKind kind);
Command to_command(ParsedCommand parsed);

// Serializes outbound protocol lines; flushes after each one.
class ProtocolWriter {
public:
  explicit ProtocolWriter(std::ostream& out, std::shared_ptr<Logger> logger = nullptr);

  void send(const std::string& name, const std::vector<std::string>& args = {});

  void version() { send("VERSION", {kProtocolVersion}); }
  void ack() { send("OK"); }
  void changes(const std::string& replica) { send("CHANGES", {replica}); }
  void recursive(const std::string& relative_path) { send("RECURSIVE", {relative_path}); }
  void done() { send("DONE"); }
  void error(const std::string& message) { send("ERROR", {message}); }

private:
  std::ostream& out_;
  std::shared_ptr<Logger> logger_;
  std::mutex write_mutex_;
};
