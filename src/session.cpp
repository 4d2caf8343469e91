#include "session.hpp"

#include <utility>

namespace {

const char* kLinkUnsupported =
  "link following is not supported, please disable this option (-links)";

} // namespace

void await_handshake(LineSource& input, Logger& logger) {
  auto next = input.next_line();
  if(next.status != LineResult::Status::Line) {
    throw HandshakeError("Input closed before VERSION");
  }
  logger.debug("input: {}", next.line);
  auto cmd = to_command(parse_command(next.line));
  if(cmd.kind != CommandKind::Version) {
    throw HandshakeError("Unexpected version cmd: " + cmd.name);
  }
  if(cmd.args.empty()) {
    throw HandshakeError("Unexpected version: none");
  }
  if(cmd.args[0] != kProtocolVersion) {
    throw HandshakeError("Unexpected version: " + cmd.args[0]);
  }
  logger.debug("handshake complete (version {})", kProtocolVersion);
}

Session::Session(SessionState& state,
                 WatchService& watcher,
                 LineSource& input,
                 ProtocolWriter& out,
                 std::shared_ptr<Logger> logger)
  : state_(state),
    watcher_(watcher),
    input_(input),
    out_(out),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("session")) {}

void Session::pump_events() {
  for(const auto& event : watcher_.drain()) {
    state_.changes.record(event, state_.replicas);
  }
  for(const auto& replica : state_.changes.pending_replicas()) {
    out_.changes(replica);
  }
}

bool Session::handle_line(const std::string& line) {
  logger_->debug("input: {}", line);
  auto parsed = parse_command(line);
  if(parsed.empty()) {
    logger_->debug("blank line, ending session");
    return false;
  }
  dispatch(to_command(std::move(parsed)));
  return true;
}

void Session::dispatch(const Command& cmd) {
  // The host re-synchronizes on anything but WAIT, so undelivered changes
  // are stale. CHANGES takes its own replica's data before the reset.
  switch(cmd.kind) {
    case CommandKind::Wait:
      // advisory only
      return;
    case CommandKind::Changes:
      send_changes(cmd.arg(0));
      state_.changes.clear();
      return;
    case CommandKind::Debug:
      state_.changes.clear();
      return;
    case CommandKind::Start: {
      const auto& replica = cmd.arg(0);
      const auto& path = cmd.arg(1);
      state_.changes.clear();
      start_replica(replica, path);
      return;
    }
    case CommandKind::Reset:
      state_.changes.clear();
      reset_replica(cmd.arg(0));
      return;
    case CommandKind::Version:
    case CommandKind::Dir:
    case CommandKind::Link:
    case CommandKind::Done:
    case CommandKind::Unknown:
      break;
  }
  throw ProtocolError("Unexpected root cmd: " + cmd.name);
}

void Session::start_replica(const std::string& replica, const std::string& path) {
  logger_->info("START {} at {}", replica, path);
  watcher_.watch(path);
  out_.ack();
  await_walk(replica);

  auto existing = state_.replicas.find(replica);
  if(existing != state_.replicas.end()) {
    // each START holds one registration; release the one being replaced
    watcher_.unwatch(existing->second);
    existing->second = path;
  } else {
    state_.replicas.emplace(replica, path);
  }
  logger_->info("Replica {} registered ({} total)", replica, state_.replicas.size());
}

void Session::await_walk(const std::string& replica) {
  for(;;) {
    auto next = input_.next_line();
    if(next.status != LineResult::Status::Line) {
      throw ProtocolError("Input closed while starting replica " + replica);
    }
    logger_->debug("input: {}", next.line);
    auto cmd = to_command(parse_command(next.line));
    switch(cmd.kind) {
      case CommandKind::Dir:
        out_.ack();
        continue;
      case CommandKind::Link:
        throw UnsupportedError(kLinkUnsupported);
      case CommandKind::Done:
        return;
      case CommandKind::Version:
      case CommandKind::Start:
      case CommandKind::Wait:
      case CommandKind::Changes:
      case CommandKind::Reset:
      case CommandKind::Debug:
      case CommandKind::Unknown:
        break;
    }
    throw ProtocolError("Unexpected cmd: " + cmd.name);
  }
}

void Session::send_changes(const std::string& replica) {
  auto paths = state_.changes.drain(replica);
  logger_->debug("CHANGES {}: {} path(s)", replica, paths.size());
  for(const auto& path : paths) {
    out_.recursive(path);
  }
  out_.done();
}

void Session::reset_replica(const std::string& replica) {
  auto it = state_.replicas.find(replica);
  if(it == state_.replicas.end()) {
    logger_->warn("RESET for unknown replica {}, ignoring", replica);
    return;
  }
  watcher_.unwatch(it->second);
  state_.changes.forget(replica);
  logger_->info("Replica {} reset ({})", replica, it->second);
  state_.replicas.erase(it);
}
