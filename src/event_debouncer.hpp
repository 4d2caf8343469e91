#pragma once

#include <chrono>
#include <cstddef>
#include <list>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "watch_service.hpp"

// Coalesces per-path notifications inside a fixed window that opens with
// the first event for the path; later events fold in without extending
// it. Renames, errors and rescans are kept as-is and released after the
// delay in arrival order.
// Not thread-safe; the owner serializes access.
class EventDebouncer {
public:
  using Clock = std::chrono::steady_clock;

  explicit EventDebouncer(std::chrono::milliseconds delay = std::chrono::milliseconds(1000));

  void add(const RawEvent& event, Clock::time_point now = Clock::now());
  std::vector<RawEvent> take_ready(Clock::time_point now = Clock::now());

  std::size_t pending() const { return entries_.size(); }
  std::chrono::milliseconds delay() const { return delay_; }

  // Result of folding `next` into a pending `prev`; nullopt cancels both.
  static std::optional<RawEvent::Kind> coalesce(RawEvent::Kind prev, RawEvent::Kind next);

private:
  struct Entry {
    RawEvent event;
    Clock::time_point first_seen;
    bool coalescable = false;
  };

  std::chrono::milliseconds delay_;
  std::list<Entry> entries_;
  std::unordered_map<std::string, std::list<Entry>::iterator> by_path_;
};
