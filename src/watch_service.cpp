#include "watch_service.hpp"

const char* raw_event_kind_name(RawEvent::Kind kind) {
  switch(kind) {
    case RawEvent::Kind::Create: return "create";
    case RawEvent::Kind::Write:  return "write";
    case RawEvent::Kind::Remove: return "remove";
    case RawEvent::Kind::Chmod:  return "chmod";
    case RawEvent::Kind::Rename: return "rename";
    case RawEvent::Kind::Error:  return "error";
    case RawEvent::Kind::Rescan: return "rescan";
  }
  return "unknown";
}
