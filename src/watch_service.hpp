#pragma once

#include <string>
#include <vector>

struct RawEvent {
  enum class Kind {
    Create,
    Write,
    Remove,
    Chmod,
    Rename,   // path -> target
    Error,    // path + cause
    Rescan    // kernel queue overflowed, nothing to attribute
  };

  Kind kind = Kind::Write;
  std::string path;
  std::string target;
  std::string cause;

  static RawEvent make(Kind kind, std::string path) {
    RawEvent ev;
    ev.kind = kind;
    ev.path = std::move(path);
    return ev;
  }

  static RawEvent rename(std::string from, std::string to) {
    RawEvent ev;
    ev.kind = Kind::Rename;
    ev.path = std::move(from);
    ev.target = std::move(to);
    return ev;
  }

  static RawEvent error(std::string path, std::string cause) {
    RawEvent ev;
    ev.kind = Kind::Error;
    ev.path = std::move(path);
    ev.cause = std::move(cause);
    return ev;
  }
};

const char* raw_event_kind_name(RawEvent::Kind kind);

// Recursive watch registrations plus a buffered event stream.
// Only the session mutates registrations; drain() never blocks.
class WatchService {
public:
  virtual ~WatchService() = default;

  // Throws WatchError when the path cannot be watched.
  virtual void watch(const std::string& path) = 0;
  // Unknown paths are ignored.
  virtual void unwatch(const std::string& path) = 0;
  virtual std::vector<RawEvent> drain() = 0;
};
