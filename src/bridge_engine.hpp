#pragma once

#include <chrono>
#include <memory>

#include "line_source.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "session.hpp"
#include "watch_service.hpp"

// Main loop: alternates between draining filesystem events and waiting
// (bounded) for the next host command.
class BridgeEngine {
public:
  struct Options {
    std::chrono::milliseconds poll_timeout{1000};
  };

  BridgeEngine(WatchService& watcher,
               LineSource& input,
               ProtocolWriter& out,
               Options options,
               std::shared_ptr<Logger> logger = nullptr);

  // Announces VERSION, performs the handshake and serves commands until the
  // input ends. Returns the process exit status; fatal errors are reported
  // to the host as ERROR before returning 1.
  int run();

  const SessionState& state() const { return state_; }

private:
  void serve();

  WatchService& watcher_;
  LineSource& input_;
  ProtocolWriter& out_;
  Options options_;
  std::shared_ptr<Logger> logger_;
  SessionState state_;
};
