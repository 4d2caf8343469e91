#include "line_source.hpp"

StreamLineSource::StreamLineSource(std::istream& in)
  : in_(in), shared_(std::make_shared<Shared>()) {}

StreamLineSource::~StreamLineSource() {
  if(!reader_.joinable()) return;
  bool closed = false;
  {
    std::lock_guard<std::mutex> lock(shared_->mutex);
    closed = shared_->closed;
  }
  // a reader still blocked in getline cannot be interrupted
  if(closed) {
    reader_.join();
  } else {
    reader_.detach();
  }
}

void StreamLineSource::start() {
  if(reader_.joinable()) return;
  auto shared = shared_;
  std::istream* in = &in_;
  reader_ = std::thread([shared, in](){
    std::string line;
    while(std::getline(*in, line)) {
      if(!line.empty() && line.back() == '\r') line.pop_back();
      {
        std::lock_guard<std::mutex> lock(shared->mutex);
        shared->lines.push_back(std::move(line));
      }
      shared->cv.notify_one();
      line.clear();
    }
    {
      std::lock_guard<std::mutex> lock(shared->mutex);
      shared->closed = true;
    }
    shared->cv.notify_all();
  });
}

LineResult StreamLineSource::pop_locked() {
  if(!shared_->lines.empty()) {
    auto line = std::move(shared_->lines.front());
    shared_->lines.pop_front();
    return LineResult::of(std::move(line));
  }
  if(shared_->closed) return LineResult::closed();
  return LineResult::timeout();
}

LineResult StreamLineSource::next_line(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(shared_->mutex);
  shared_->cv.wait_for(lock, timeout, [this](){
    return !shared_->lines.empty() || shared_->closed;
  });
  return pop_locked();
}

LineResult StreamLineSource::next_line() {
  std::unique_lock<std::mutex> lock(shared_->mutex);
  shared_->cv.wait(lock, [this](){
    return !shared_->lines.empty() || shared_->closed;
  });
  return pop_locked();
}
