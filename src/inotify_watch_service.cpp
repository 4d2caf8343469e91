#include "inotify_watch_service.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>

#include "protocol.hpp"
#include "utils.hpp"

namespace fs = std::filesystem;

namespace {

bool is_real_directory(const fs::directory_entry& entry) {
  std::error_code ec;
  return entry.symlink_status(ec).type() == fs::file_type::directory;
}

} // namespace

InotifyWatchService::InotifyWatchService(Options options, std::shared_ptr<Logger> logger)
  : options_(options),
    logger_(logger ? std::move(logger) : std::make_shared<Logger>("inotify")),
    debouncer_(options.debounce_delay) {}

InotifyWatchService::~InotifyWatchService() {
  stop();
}

void InotifyWatchService::start() {
  if(started_) return;
  fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if(fd_ < 0) {
    throw WatchError(fmt::format("inotify_init1 failed: {}", std::strerror(errno)));
  }
  stream_ = std::make_unique<asio::posix::stream_descriptor>(io_, fd_);
  started_ = true;
  start_read();
  io_thread_ = std::thread([this](){
    io_.run();
  });
  logger_->debug("inotify watcher started (debounce {}ms)", options_.debounce_delay.count());
}

void InotifyWatchService::stop() {
  if(!started_) return;
  started_ = false;

  io_.stop();
  if(io_thread_.joinable()) {
    io_thread_.join();
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if(stream_) {
      std::error_code ec;
      stream_->close(ec);
    }
    stream_.reset();
    fd_ = -1;
    wd_to_path_.clear();
    path_to_wd_.clear();
    roots_.clear();
    pending_moves_.clear();
  }
  io_.restart();
}

void InotifyWatchService::start_read() {
  if(!stream_) return;
  stream_->async_read_some(asio::buffer(read_buf_),
    [this](std::error_code ec, std::size_t bytes){
      if(ec == asio::error::operation_aborted) return;
      if(ec) {
        logger_->error("inotify read failed: {}", ec.message());
        std::lock_guard<std::mutex> lock(mutex_);
        push_event_locked(RawEvent::error("", "inotify read failed: " + ec.message()));
        return;
      }
      handle_read(bytes);
      start_read();
    });
}

void InotifyWatchService::handle_read(std::size_t bytes) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t offset = 0;
  while(offset + sizeof(struct inotify_event) <= bytes) {
    const auto* ev = reinterpret_cast<const struct inotify_event*>(read_buf_.data() + offset);
    handle_event(*ev);
    offset += sizeof(struct inotify_event) + ev->len;
  }
  // a move whose partner did not arrive in the same read left the tree
  flush_unpaired_moves();
}

void InotifyWatchService::handle_event(const struct inotify_event& ev) {
  if(ev.mask & IN_Q_OVERFLOW) {
    logger_->warn("inotify queue overflowed, events were lost");
    push_event_locked(RawEvent::make(RawEvent::Kind::Rescan, ""));
    return;
  }

  auto it = wd_to_path_.find(ev.wd);
  if(it == wd_to_path_.end()) return;
  const std::string dir = it->second;

  if(ev.mask & IN_IGNORED) {
    auto by_path = path_to_wd_.find(dir);
    if(by_path != path_to_wd_.end() && by_path->second == ev.wd) {
      path_to_wd_.erase(by_path);
    }
    wd_to_path_.erase(it);
    return;
  }

  const bool is_dir = (ev.mask & IN_ISDIR) != 0;
  const std::string path = ev.len > 0 ? join_path(dir, ev.name) : dir;

  if(ev.mask & IN_DELETE_SELF) {
    // children report their own removal through the parent watch
    if(roots_.count(dir)) {
      push_event_locked(RawEvent::make(RawEvent::Kind::Remove, dir));
    }
    return;
  }
  if(ev.mask & IN_CREATE) {
    push_event_locked(RawEvent::make(RawEvent::Kind::Create, path));
    if(is_dir) add_subtree_locked(path, true);
    return;
  }
  if(ev.mask & IN_DELETE) {
    push_event_locked(RawEvent::make(RawEvent::Kind::Remove, path));
    return;
  }
  if(ev.mask & IN_MOVED_FROM) {
    pending_moves_[ev.cookie] = PendingMove{path, is_dir};
    return;
  }
  if(ev.mask & IN_MOVED_TO) {
    auto move = pending_moves_.find(ev.cookie);
    if(move != pending_moves_.end()) {
      push_event_locked(RawEvent::rename(move->second.path, path));
      if(is_dir) rebase_subtree_locked(move->second.path, path);
      pending_moves_.erase(move);
    } else {
      push_event_locked(RawEvent::make(RawEvent::Kind::Create, path));
      if(is_dir) add_subtree_locked(path, true);
    }
    return;
  }
  if(ev.mask & (IN_MODIFY | IN_CLOSE_WRITE)) {
    push_event_locked(RawEvent::make(RawEvent::Kind::Write, path));
    return;
  }
  if(ev.mask & IN_ATTRIB) {
    push_event_locked(RawEvent::make(RawEvent::Kind::Chmod, path));
  }
}

void InotifyWatchService::flush_unpaired_moves() {
  for(auto& entry : pending_moves_) {
    push_event_locked(RawEvent::make(RawEvent::Kind::Remove, entry.second.path));
    if(entry.second.is_dir) remove_subtree_locked(entry.second.path, false);
  }
  pending_moves_.clear();
}

int InotifyWatchService::add_watch_locked(const std::string& path, bool follow) {
  uint32_t mask = follow ? (kDirMask & ~static_cast<uint32_t>(IN_DONT_FOLLOW)) : kDirMask;
  int wd = inotify_add_watch(fd_, path.c_str(), mask);
  if(wd < 0) return wd;
  wd_to_path_[wd] = path;
  path_to_wd_[path] = wd;
  return wd;
}

void InotifyWatchService::add_subtree_locked(const std::string& dir, bool report_entries) {
  if(add_watch_locked(dir, false) < 0) {
    int err = errno;
    if(err == ENOENT) return;  // already gone again
    push_event_locked(RawEvent::error(dir, std::strerror(err)));
    return;
  }

  std::error_code ec;
  fs::recursive_directory_iterator it(dir, fs::directory_options::skip_permission_denied, ec);
  for(fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
    const std::string child = it->path().string();
    if(report_entries) {
      // created before the watch above was in place
      push_event_locked(RawEvent::make(RawEvent::Kind::Create, child));
    }
    if(!is_real_directory(*it)) continue;
    if(add_watch_locked(child, false) < 0) {
      int err = errno;
      if(err != ENOENT) push_event_locked(RawEvent::error(child, std::strerror(err)));
    }
  }
  if(ec && ec != std::errc::no_such_file_or_directory) {
    logger_->warn("Error walking {}: {}", dir, ec.message());
  }
}

void InotifyWatchService::remove_subtree_locked(const std::string& dir, bool keep_covered) {
  std::vector<std::pair<std::string, int>> doomed;
  for(const auto& entry : path_to_wd_) {
    if(!path_is_under(dir, entry.first)) continue;
    if(keep_covered && covered_by_root_locked(entry.first)) continue;
    doomed.emplace_back(entry.first, entry.second);
  }
  for(const auto& entry : doomed) {
    if(inotify_rm_watch(fd_, entry.second) < 0) {
      logger_->debug("inotify_rm_watch({}) failed: {}", entry.first, std::strerror(errno));
    }
    wd_to_path_.erase(entry.second);
    path_to_wd_.erase(entry.first);
  }
}

void InotifyWatchService::rebase_subtree_locked(const std::string& from, const std::string& to) {
  std::vector<std::pair<std::string, int>> moved;
  for(const auto& entry : path_to_wd_) {
    if(path_is_under(from, entry.first)) moved.emplace_back(entry.first, entry.second);
  }
  for(const auto& entry : moved) {
    std::string renamed = to + entry.first.substr(from.size());
    path_to_wd_.erase(entry.first);
    path_to_wd_[renamed] = entry.second;
    wd_to_path_[entry.second] = renamed;
  }
}

bool InotifyWatchService::covered_by_root_locked(const std::string& path) const {
  for(const auto& root : roots_) {
    if(path_is_under(root.first, path)) return true;
  }
  return false;
}

void InotifyWatchService::push_event_locked(RawEvent event) {
  if(event.kind == RawEvent::Kind::Rename) {
    logger_->debug("FS event: {} {} -> {}", raw_event_kind_name(event.kind), event.path, event.target);
  } else {
    logger_->debug("FS event: {} {}", raw_event_kind_name(event.kind), event.path);
  }
  debouncer_.add(event);
}

void InotifyWatchService::watch(const std::string& path) {
  if(!started_) {
    throw WatchError("watch service is not running");
  }
  const std::string root = normalize_root(path);

  std::lock_guard<std::mutex> lock(mutex_);
  auto found = roots_.find(root);
  if(found != roots_.end()) {
    ++found->second;
    logger_->debug("{} already watched ({} registrations)", root, found->second);
    return;
  }

  std::error_code ec;
  auto status = fs::status(root, ec);
  if(ec || !fs::exists(status)) {
    throw WatchError(fmt::format("Cannot watch {}: {}", root,
                                 ec ? ec.message() : std::string("No such file or directory")));
  }
  if(add_watch_locked(root, true) < 0) {
    throw WatchError(fmt::format("Cannot watch {}: {}", root, std::strerror(errno)));
  }

  std::size_t directories = 1;
  if(fs::is_directory(status)) {
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    for(fs::recursive_directory_iterator end; !ec && it != end; it.increment(ec)) {
      if(!is_real_directory(*it)) continue;
      const std::string child = it->path().string();
      if(add_watch_locked(child, false) < 0) {
        int err = errno;
        if(err == ENOENT) continue;
        throw WatchError(fmt::format("Cannot watch {}: {}", child, std::strerror(err)));
      }
      ++directories;
    }
    if(ec) {
      throw WatchError(fmt::format("Cannot walk {}: {}", root, ec.message()));
    }
  }

  roots_[root] = 1;
  logger_->info("Watching {} ({} directories)", root, directories);
}

void InotifyWatchService::unwatch(const std::string& path) {
  const std::string root = normalize_root(path);
  std::lock_guard<std::mutex> lock(mutex_);
  auto found = roots_.find(root);
  if(found == roots_.end()) {
    logger_->warn("unwatch: {} is not watched", root);
    return;
  }
  if(--found->second > 0) return;
  roots_.erase(found);
  remove_subtree_locked(root, true);
  logger_->info("Stopped watching {}", root);
}

std::vector<RawEvent> InotifyWatchService::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  return debouncer_.take_ready();
}

std::size_t InotifyWatchService::watch_descriptor_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return wd_to_path_.size();
}

bool InotifyWatchService::is_watching(const std::string& path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return roots_.count(normalize_root(path)) > 0;
}
