#include "event_debouncer.hpp"

namespace {

bool is_path_event(RawEvent::Kind kind) {
  switch(kind) {
    case RawEvent::Kind::Create:
    case RawEvent::Kind::Write:
    case RawEvent::Kind::Remove:
    case RawEvent::Kind::Chmod:
      return true;
    case RawEvent::Kind::Rename:
    case RawEvent::Kind::Error:
    case RawEvent::Kind::Rescan:
      return false;
  }
  return false;
}

} // namespace

EventDebouncer::EventDebouncer(std::chrono::milliseconds delay)
  : delay_(delay.count() < 0 ? std::chrono::milliseconds(0) : delay) {}

std::optional<RawEvent::Kind> EventDebouncer::coalesce(RawEvent::Kind prev, RawEvent::Kind next) {
  using Kind = RawEvent::Kind;
  if(next == Kind::Remove) {
    // created and gone again inside one window: nothing to report
    if(prev == Kind::Create) return std::nullopt;
    return Kind::Remove;
  }
  if(next == Kind::Create) {
    return prev == Kind::Remove ? Kind::Write : Kind::Create;
  }
  // Write or Chmod
  if(prev == Kind::Create) return Kind::Create;
  if(prev == Kind::Remove) return Kind::Write;
  if(prev == Kind::Chmod && next == Kind::Chmod) return Kind::Chmod;
  return Kind::Write;
}

void EventDebouncer::add(const RawEvent& event, Clock::time_point now) {
  if(!is_path_event(event.kind)) {
    entries_.push_back(Entry{event, now, false});
    return;
  }

  auto found = by_path_.find(event.path);
  if(found == by_path_.end()) {
    auto it = entries_.insert(entries_.end(), Entry{event, now, true});
    by_path_.emplace(event.path, it);
    return;
  }

  auto entry = found->second;
  auto merged = coalesce(entry->event.kind, event.kind);
  if(!merged) {
    entries_.erase(entry);
    by_path_.erase(found);
    return;
  }
  entry->event.kind = *merged;
}

std::vector<RawEvent> EventDebouncer::take_ready(Clock::time_point now) {
  std::vector<RawEvent> ready;
  for(auto it = entries_.begin(); it != entries_.end();) {
    if(now - it->first_seen < delay_) {
      ++it;
      continue;
    }
    if(it->coalescable) {
      by_path_.erase(it->event.path);
    }
    ready.push_back(std::move(it->event));
    it = entries_.erase(it);
  }
  return ready;
}
