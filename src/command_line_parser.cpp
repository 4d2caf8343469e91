#include "command_line_parser.hpp"

#include <cctype>

#include <nlohmann/json.hpp>

#include "log.hpp"

namespace {

// "--key", "--key=value", "-k" and "-k=value"; "-5" is a value, not an option.
bool looks_like_option(const std::string& token) {
  if(token.rfind("--", 0) == 0) return token.size() > 2;
  return token.size() >= 2 && token[0] == '-' &&
         !std::isdigit(static_cast<unsigned char>(token[1]));
}

std::string describe_default(const std::string& type, const nlohmann::json& value) {
  if(type == "bool") return value.get<bool>() ? "true" : "false";
  if(value.is_string()) {
    auto text = value.get<std::string>();
    return text.empty() ? "none" : text;
  }
  return value.dump();
}

} // namespace

CommandLineParser::CommandLineParser(std::string process_name,
                                     nlohmann::json settings_spec)
  : process_name_(std::move(process_name)),
    settings_spec_(std::move(settings_spec)) {}

bool CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings, std::string& error) const {
  error.clear();
  for(int i = 1; i < argc; ++i) {
    const std::string token = argv[i];
    if(!looks_like_option(token)) {
      error = "Unexpected argument '" + token + "'";
      return false;
    }

    std::string name = token.substr(token.rfind("--", 0) == 0 ? 2 : 1);
    std::optional<std::string> value;
    auto eq = name.find('=');
    if(eq != std::string::npos) {
      value = name.substr(eq + 1);
      name.erase(eq);
    }

    auto key = settings.resolve_key(name);
    if(!key) {
      error = "Unknown option " + token;
      return false;
    }

    if(!value) {
      const bool has_next = i + 1 < argc;
      if(settings.is_bool_setting(*key)) {
        // flags take an optional explicit literal: -v, -v false
        if(has_next && SettingsManager::is_bool_literal(argv[i + 1])) {
          value = argv[++i];
        } else {
          value = "true";
        }
      } else if(has_next) {
        value = argv[++i];
      } else {
        error = "Missing value for option '" + name + "'";
        return false;
      }
    }

    std::string why;
    if(!settings.set_from_string(*key, *value, why)) {
      error = "Invalid value for option '" + name + "': " + why;
      return false;
    }
  }
  return true;
}

void CommandLineParser::usage() const {
  print_err("{} - filesystem change notifications over a line protocol on stdin/stdout", process_name_);
  print_err("");
  print_err("Usage: {} [options]", process_name_);
  print_err("");
  print_err("Options:");
  for(const auto& entry : settings_spec_) {
    const auto key = entry.at("key").get<std::string>();
    const auto type = entry.at("type").get<std::string>();
    std::string flags = "--" + key;
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      flags += ", -" + alias;
    }
    const std::string hint = (type == "bool") ? "" : " <" + type + ">";
    print_err("  {:<34} {} (default: {})",
              flags + hint,
              entry.value("description", ""),
              describe_default(type, entry.at("default")));
  }
  print_err("");
  print_err("Environment:");
  print_err("  WATCHBRIDGE_LOG  log level (trace, debug, info, warn, error, off)");
}
