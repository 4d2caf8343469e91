#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <istream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

struct LineResult {
  enum class Status { Line, Timeout, Closed };
  Status status = Status::Closed;
  std::string line;

  static LineResult of(std::string text) { return {Status::Line, std::move(text)}; }
  static LineResult timeout() { return {Status::Timeout, {}}; }
  static LineResult closed() { return {Status::Closed, {}}; }
};

// Source of inbound protocol lines.
class LineSource {
public:
  virtual ~LineSource() = default;

  // Waits at most `timeout` for the next line.
  virtual LineResult next_line(std::chrono::milliseconds timeout) = 0;
  // Waits until a line arrives or the input closes.
  virtual LineResult next_line() = 0;
};

// Reads an istream line by line on a dedicated thread and queues the lines.
class StreamLineSource : public LineSource {
public:
  explicit StreamLineSource(std::istream& in);
  ~StreamLineSource() override;

  void start();

  LineResult next_line(std::chrono::milliseconds timeout) override;
  LineResult next_line() override;

private:
  struct Shared {
    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> lines;
    bool closed = false;
  };

  LineResult pop_locked();

  std::istream& in_;
  std::shared_ptr<Shared> shared_;
  std::thread reader_;
};
