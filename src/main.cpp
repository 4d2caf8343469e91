#include <cpptrace/cpptrace.hpp>

#include <chrono>
#include <iostream>
#include <memory>
#include <string>

#include "bridge_engine.hpp"
#include "command_line_parser.hpp"
#include "inotify_watch_service.hpp"
#include "line_source.hpp"
#include "log.hpp"
#include "protocol.hpp"
#include "settings_manager.hpp"

namespace {

bool load_settings(int argc, char** argv,
                   const CommandLineParser& parser,
                   SettingsManager& settings) {
  std::string error;
  if(!parser.parse(argc, argv, settings, error)) {
    print_err("{}", error);
    parser.usage();
    return false;
  }
  auto config = settings.get<std::string>("config");
  if(config.empty()) return true;

  settings.set_settings_path(config);
  if(!settings.load()) return false;
  // command-line options win over the file
  if(!parser.parse(argc, argv, settings, error)) {
    print_err("{}", error);
    return false;
  }
  return true;
}

} // namespace

int main(int argc, char** argv){
  try {
    std::ios::sync_with_stdio(false);

    auto settings = std::make_shared<SettingsManager>();
    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "watchbridge");
    if(!load_settings(argc, argv, parser, *settings)) {
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings->get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("watchbridge");
    logger->debug("settings: {}", settings->get_json().dump());

    // lower bounds are enforced by SettingsManager
    const int debounce_ms = settings->get<int>("debounce_ms");
    const int poll_timeout_ms = settings->get<int>("poll_timeout_ms");

    ProtocolWriter writer(std::cout, logger);

    InotifyWatchService::Options watch_options;
    watch_options.debounce_delay = std::chrono::milliseconds(debounce_ms);
    InotifyWatchService watcher(watch_options, std::make_shared<Logger>("inotify"));
    try {
      watcher.start();
    } catch(const WatchError& e) {
      logger->error("{}", e.what());
      writer.error(e.what());
      return 1;
    }

    StreamLineSource input(std::cin);
    input.start();

    BridgeEngine::Options engine_options;
    engine_options.poll_timeout = std::chrono::milliseconds(poll_timeout_ms);
    BridgeEngine engine(watcher, input, writer, engine_options, logger);
    int status = engine.run();

    watcher.stop();
    return status;
  } catch(std::exception& e) {
    init(false);
    Logger logger("watchbridge-main");
    logger.error("Exception: {}", e.what());
    std::cout << format_command("ERROR", {e.what()}) << std::flush;
    cpptrace::generate_trace().print();
    return 1;
  }
}
