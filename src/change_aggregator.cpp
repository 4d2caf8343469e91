#include "change_aggregator.hpp"

#include "protocol.hpp"
#include "utils.hpp"

void ChangeAggregator::record(const RawEvent& event, const ReplicaRegistry& replicas) {
  switch(event.kind) {
    case RawEvent::Kind::Create:
    case RawEvent::Kind::Write:
    case RawEvent::Kind::Remove:
    case RawEvent::Kind::Chmod:
      record_path(event.path, replicas);
      return;
    case RawEvent::Kind::Rename:
      record_path(event.path, replicas);
      record_path(event.target, replicas);
      return;
    case RawEvent::Kind::Error:
      throw WatchError("Error occured at watched path (" + event.path + "): " + event.cause);
    case RawEvent::Kind::Rescan:
      return;
  }
}

void ChangeAggregator::record_path(const std::string& path, const ReplicaRegistry& replicas) {
  for(const auto& replica : replicas) {
    auto relative = relative_to_root(replica.second, path);
    if(!relative) continue;
    pending_[replica.first].push_back(std::move(*relative));
  }
}

std::vector<std::string> ChangeAggregator::drain(const std::string& replica) {
  auto it = pending_.find(replica);
  if(it == pending_.end()) return {};
  std::vector<std::string> out = std::move(it->second);
  pending_.erase(it);
  return out;
}

std::vector<std::string> ChangeAggregator::pending_replicas() const {
  std::vector<std::string> out;
  out.reserve(pending_.size());
  for(const auto& entry : pending_) out.push_back(entry.first);
  return out;
}
