#include "bridge_engine.hpp"

#include <stdexcept>

BridgeEngine::BridgeEngine(WatchService& watcher,
                           LineSource& input,
                           ProtocolWriter& out,
                           Options options,
                           std::shared_ptr<Logger> logger)
  : watcher_(watcher),
    input_(input),
    out_(out),
    options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("bridge")) {
  if(options_.poll_timeout.count() <= 0) {
    options_.poll_timeout = std::chrono::milliseconds(1000);
  }
}

int BridgeEngine::run() {
  out_.version();
  try {
    serve();
  } catch(const HandshakeError& e) {
    logger_->error("Handshake failed: {}", e.what());
    out_.error(e.what());
    return 1;
  } catch(const UnsupportedError& e) {
    logger_->error("Unsupported: {}", e.what());
    out_.error(e.what());
    return 1;
  } catch(const std::runtime_error& e) {
    // ProtocolError, WatchError and filesystem failures
    logger_->error("{}", e.what());
    out_.error(e.what());
    return 1;
  }
  logger_->info("Session finished");
  return 0;
}

void BridgeEngine::serve() {
  await_handshake(input_, *logger_);
  Session session(state_, watcher_, input_, out_, logger_);

  for(;;) {
    session.pump_events();

    auto next = input_.next_line(options_.poll_timeout);
    switch(next.status) {
      case LineResult::Status::Timeout:
        continue;
      case LineResult::Status::Closed:
        logger_->debug("input closed");
        return;
      case LineResult::Status::Line:
        break;
    }
    if(!session.handle_line(next.line)) return;
  }
}
