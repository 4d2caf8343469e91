#include "log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdlib>
#include <memory>
#include <vector>

namespace {

std::shared_ptr<spdlog::logger> g_stderr_logger;
std::shared_ptr<spdlog::logger> g_plain_logger;
std::once_flag g_loggers_once;
std::atomic<bool> g_passthrough{true};

void ensure_loggers() {
  std::call_once(g_loggers_once, [](){
    auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();

    g_stderr_logger = std::make_shared<spdlog::logger>("watchbridge", sink);
    g_stderr_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    g_stderr_logger->set_level(spdlog::level::info);
    g_stderr_logger->flush_on(spdlog::level::warn);

    // usage text and option errors: always shown, no decoration
    g_plain_logger = std::make_shared<spdlog::logger>("watchbridge.plain", sink);
    g_plain_logger->set_pattern("%v");
    g_plain_logger->set_level(spdlog::level::trace);
    g_plain_logger->flush_on(spdlog::level::trace);
  });
}

} // namespace

void init(bool verbose) {
  ensure_loggers();
  auto level = spdlog::level::info;
  if(verbose) {
    level = spdlog::level::debug;
  } else if(auto from_env = log_level_from_env()) {
    level = *from_env;
  }
  set_log_level(level);
}

void set_log_passthrough(bool enabled) {
  g_passthrough.store(enabled);
}

std::optional<spdlog::level::level_enum> log_level_from_env() {
  const char* raw = std::getenv("WATCHBRIDGE_LOG");
  if(!raw || !*raw) return std::nullopt;
  std::string value(raw);
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  if(value == "trace") return spdlog::level::trace;
  if(value == "debug") return spdlog::level::debug;
  if(value == "info") return spdlog::level::info;
  if(value == "warn" || value == "warning") return spdlog::level::warn;
  if(value == "error") return spdlog::level::err;
  if(value == "off") return spdlog::level::off;
  return std::nullopt;
}

void set_log_level(spdlog::level::level_enum level) {
  ensure_loggers();
  g_stderr_logger->set_level(level);
}

namespace detail {

void write_stderr(const std::string& channel,
                  spdlog::level::level_enum level,
                  const std::string& message,
                  bool plain) {
  ensure_loggers();
  if(!g_passthrough.load()) return;
  if(plain) {
    g_plain_logger->log(level, "{}", message);
  } else if(channel.empty()) {
    g_stderr_logger->log(level, "{}", message);
  } else {
    g_stderr_logger->log(level, "[{}] {}", channel, message);
  }
}

} // namespace detail

LogListenerHandle Logger::add_listener(Listener listener) {
  if(!listener) return 0;
  std::lock_guard<std::mutex> lock(listener_mutex_);
  const auto handle = next_handle_++;
  listeners_.emplace(handle, std::move(listener));
  return handle;
}

void Logger::remove_listener(LogListenerHandle handle) {
  std::lock_guard<std::mutex> lock(listener_mutex_);
  listeners_.erase(handle);
}

void Logger::emit(spdlog::level::level_enum level, const std::string& message) {
  std::vector<Listener> listeners;
  {
    std::lock_guard<std::mutex> lock(listener_mutex_);
    listeners.reserve(listeners_.size());
    for(const auto& entry : listeners_) listeners.push_back(entry.second);
  }

  bool consumed = false;
  for(const auto& listener : listeners) {
    try {
      consumed = listener(name_, level, message) || consumed;
    } catch(const std::exception& e) {
      detail::write_stderr(name_, spdlog::level::err,
                           fmt::format("log listener threw: {}", e.what()));
    }
  }
  if(!consumed) detail::write_stderr(name_, level, message);
}
