#include "protocol.hpp"

#include <spdlog/fmt/ranges.h>

const std::string& Command::arg(std::size_t index) const {
  if(index >= args.size()) {
    throw ProtocolError("Unexpected cmd: " + name + " (missing argument " +
                        std::to_string(index + 1) + ")");
  }
  return args[index];
}

CommandKind command_kind_from_name(const std::string& name) {
  if(name == "VERSION") return CommandKind::Version;
  if(name == "START") return CommandKind::Start;
  if(name == "DIR") return CommandKind::Dir;
  if(name == "LINK") return CommandKind::Link;
  if(name == "DONE") return CommandKind::Done;
  if(name == "WAIT") return CommandKind::Wait;
  if(name == "CHANGES") return CommandKind::Changes;
  if(name == "RESET") return CommandKind::Reset;
  if(name == "DEBUG") return CommandKind::Debug;
  return CommandKind::Unknown;
}

const char* command_name(CommandKind kind) {
  switch(kind) {
    case CommandKind::Version: return "VERSION";
    case CommandKind::Start:   return "START";
    case CommandKind::Dir:     return "DIR";
    case CommandKind::Link:    return "LINK";
    case CommandKind::Done:    return "DONE";
    case CommandKind::Wait:    return "WAIT";
    case CommandKind::Changes: return "CHANGES";
    case CommandKind::Reset:   return "RESET";
    case CommandKind::Debug:   return "DEBUG";
    case CommandKind::Unknown: return "<unknown>";
  }
  return "<unknown>";
}

Command to_command(ParsedCommand parsed) {
  Command cmd;
  cmd.kind = command_kind_from_name(parsed.name);
  cmd.name = std::move(parsed.name);
  cmd.args = std::move(parsed.args);
  return cmd;
}

ProtocolWriter::ProtocolWriter(std::ostream& out, std::shared_ptr<Logger> logger)
  : out_(out), logger_(std::move(logger)) {}

void ProtocolWriter::send(const std::string& name, const std::vector<std::string>& args) {
  if(logger_) {
    logger_->debug("output: {} [{}]", name, fmt::join(args, ", "));
  }
  auto line = format_command(name, args);
  std::lock_guard<std::mutex> lock(write_mutex_);
  out_ << line;
  out_.flush();
}
