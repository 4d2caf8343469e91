#pragma once

#include <asio.hpp>

#include <sys/inotify.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "event_debouncer.hpp"
#include "log.hpp"
#include "watch_service.hpp"

// Recursive watches on top of one inotify descriptor. The descriptor is
// read on a private io_context thread; events are debounced and handed
// out by drain() on the caller's thread.
class InotifyWatchService : public WatchService {
public:
  struct Options {
    std::chrono::milliseconds debounce_delay{1000};
  };

  explicit InotifyWatchService(Options options, std::shared_ptr<Logger> logger = nullptr);
  ~InotifyWatchService() override;

  // Opens the inotify descriptor and starts the reader thread.
  // Throws WatchError when inotify is unavailable.
  void start();
  void stop();

  void watch(const std::string& path) override;
  void unwatch(const std::string& path) override;
  std::vector<RawEvent> drain() override;

  std::size_t watch_descriptor_count() const;
  bool is_watching(const std::string& path) const;

private:
  static constexpr uint32_t kDirMask =
    IN_CREATE | IN_DELETE | IN_MODIFY | IN_ATTRIB | IN_CLOSE_WRITE |
    IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE_SELF | IN_DONT_FOLLOW;

  struct PendingMove {
    std::string path;
    bool is_dir = false;
  };

  void start_read();
  void handle_read(std::size_t bytes);

  // Callers hold mutex_.
  void handle_event(const struct inotify_event& ev);
  void flush_unpaired_moves();
  int add_watch_locked(const std::string& path, bool follow);
  void add_subtree_locked(const std::string& dir, bool report_entries);
  void remove_subtree_locked(const std::string& dir, bool keep_covered);
  void rebase_subtree_locked(const std::string& from, const std::string& to);
  bool covered_by_root_locked(const std::string& path) const;
  void push_event_locked(RawEvent event);

  Options options_;
  std::shared_ptr<Logger> logger_;

  asio::io_context io_;
  std::unique_ptr<asio::posix::stream_descriptor> stream_;
  std::thread io_thread_;
  alignas(struct inotify_event) std::array<char, 64 * 1024> read_buf_{};
  int fd_ = -1;
  bool started_ = false;

  mutable std::mutex mutex_;
  EventDebouncer debouncer_;
  std::unordered_map<int, std::string> wd_to_path_;
  std::unordered_map<std::string, int> path_to_wd_;
  std::map<std::string, std::size_t> roots_;  // root -> registrations
  std::map<uint32_t, PendingMove> pending_moves_;
};
