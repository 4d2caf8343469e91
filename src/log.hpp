#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>

#include <cstddef>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

// stdout carries the line protocol; every sink created here writes to stderr.
void init(bool verbose = false);

// Tests switch this off to keep stderr quiet; listeners still fire.
void set_log_passthrough(bool enabled);

// Level named by WATCHBRIDGE_LOG ("trace", "debug", "info", "warn", "error", "off").
std::optional<spdlog::level::level_enum> log_level_from_env();
void set_log_level(spdlog::level::level_enum level);

namespace detail {
// Writes `message` to the shared stderr logger, tagged with `channel` when
// non-empty. `plain` drops timestamp and level.
void write_stderr(const std::string& channel,
                  spdlog::level::level_enum level,
                  const std::string& message,
                  bool plain = false);
} // namespace detail

using LogListenerHandle = std::size_t;

// Named logger. Messages go to every listener and then to stderr, unless a
// listener reports that it consumed the message.
class Logger {
public:
  using Listener = std::function<bool(const std::string& channel,
                                      spdlog::level::level_enum level,
                                      const std::string& message)>;

  Logger() = default;
  explicit Logger(std::string name) : name_(std::move(name)) {}

  const std::string& name() const { return name_; }

  LogListenerHandle add_listener(Listener listener);
  void remove_listener(LogListenerHandle handle);

  template<typename... Args>
  void debug(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(spdlog::level::debug, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void info(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(spdlog::level::info, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void warn(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(spdlog::level::warn, fmt::format(fmt, std::forward<Args>(args)...));
  }

  template<typename... Args>
  void error(spdlog::format_string_t<Args...> fmt, Args&&... args) {
    emit(spdlog::level::err, fmt::format(fmt, std::forward<Args>(args)...));
  }

private:
  void emit(spdlog::level::level_enum level, const std::string& message);

  std::string name_;
  std::mutex listener_mutex_;
  std::map<LogListenerHandle, Listener> listeners_;
  LogListenerHandle next_handle_ = 1;
};

// Unadorned line on stderr (usage text, option errors).
template<typename... Args>
inline void print_err(spdlog::format_string_t<Args...> fmt, Args&&... args) {
  detail::write_stderr(std::string(), spdlog::level::info,
                       fmt::format(fmt, std::forward<Args>(args)...), true);
}
