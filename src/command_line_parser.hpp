#pragma once

#include <optional>
#include <string>

#include "settings_manager.hpp"

// Maps argv onto SettingsManager keys (--key value, -alias value, --key=value).
class CommandLineParser {
public:
  explicit CommandLineParser(std::string process_name = "watchbridge",
                             nlohmann::json settings_spec = SETTINGS_SPECIFICATION);

  // On failure fills `error` and leaves the remaining arguments unapplied.
  bool parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const;

  // Option summary on stderr.
  void usage() const;

private:
  std::string process_name_;
  nlohmann::json settings_spec_;
};
