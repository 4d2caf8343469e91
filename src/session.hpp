#pragma once

#include <memory>
#include <string>
#include <vector>

#include "change_aggregator.hpp"
#include "line_source.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "watch_service.hpp"

// Everything a session mutates; lives from the handshake to the end of input.
struct SessionState {
  ReplicaRegistry replicas;
  ChangeAggregator changes;
};

// Reads the host's single VERSION line. Throws HandshakeError.
void await_handshake(LineSource& input, Logger& logger);

// Command dispatcher for an established session. All members are driven
// from the main loop thread.
class Session {
public:
  Session(SessionState& state,
          WatchService& watcher,
          LineSource& input,
          ProtocolWriter& out,
          std::shared_ptr<Logger> logger);

  // Moves buffered filesystem events into the pending table and announces
  // every replica that has pending data.
  void pump_events();

  // Returns false when the line ends the session (blank line).
  // Throws on fatal protocol, link or watch errors.
  bool handle_line(const std::string& line);

private:
  void dispatch(const Command& cmd);
  void start_replica(const std::string& replica, const std::string& path);
  void await_walk(const std::string& replica);
  void send_changes(const std::string& replica);
  void reset_replica(const std::string& replica);

  SessionState& state_;
  WatchService& watcher_;
  LineSource& input_;
  ProtocolWriter& out_;
  std::shared_ptr<Logger> logger_;
};
