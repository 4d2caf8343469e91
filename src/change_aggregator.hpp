#pragma once

#include <map>
#include <string>
#include <vector>

#include "watch_service.hpp"

// replica id -> absolute root path
using ReplicaRegistry = std::map<std::string, std::string>;

// Per-replica relative paths that changed since the replica was last drained.
// Replicas without data are never present in the table.
class ChangeAggregator {
public:
  // Appends the event's path(s) to every replica whose root contains them.
  // Throws WatchError for error events; rescans are dropped.
  void record(const RawEvent& event, const ReplicaRegistry& replicas);

  std::vector<std::string> drain(const std::string& replica);

  // Ids with pending data, in id order.
  std::vector<std::string> pending_replicas() const;

  bool has_pending(const std::string& replica) const { return pending_.count(replica) > 0; }
  bool empty() const { return pending_.empty(); }

  void clear() { pending_.clear(); }
  void forget(const std::string& replica) { pending_.erase(replica); }

private:
  void record_path(const std::string& path, const ReplicaRegistry& replicas);

  std::map<std::string, std::vector<std::string>> pending_;
};
