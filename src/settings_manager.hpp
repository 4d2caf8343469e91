#pragma once

#include <algorithm>
#include <cctype>
#include <climits>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

// key, aliases, type, default, lower bound for ints, help text
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","verbose"},         {"aliases", {"v"}},            {"type","bool"},   {"default",false},                 {"description","Enable debug logging on stderr"}},
  {{"key","debounce_ms"},     {"aliases", {"debounce","d"}}, {"type","int"},    {"default",1000}, {"min",0},       {"description","Window after the first event on a path before it is reported"}},
  {{"key","poll_timeout_ms"}, {"aliases", {"poll","pt"}},    {"type","int"},    {"default",1000}, {"min",1},       {"description","Longest wait for a command before checking filesystem events"}},
  {{"key","config"},          {"aliases", {"c","settings"}}, {"type","string"}, {"default",""},                    {"description","JSON settings file loaded before command-line options"}},
  {{"key","help"},            {"aliases", {"h","?"}},        {"type","bool"},   {"default",false},                 {"description","Show command help and exit"}}
});

// Runtime options. Values start at their defaults, may be overlaid from a
// JSON file and then from the command line. Read-only as far as disk goes.
class SettingsManager {
public:
  explicit SettingsManager(const nlohmann::json& specification = SETTINGS_SPECIFICATION);

  template<typename T>
  T get(const std::string& key) const;

  bool help_requested() const { return get<bool>("help"); }

  // Parses `value` according to the setting's type. On failure leaves the
  // current value alone and fills `error`.
  bool set_from_string(const std::string& key, const std::string& value, std::string& error);

  // Overlays the file at settings_path(). Unknown or invalid entries are
  // reported and skipped; an unreadable or malformed file returns false.
  bool load() { return load_from_file(settings_path_); }
  bool load_from_file(const std::filesystem::path& path);

  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const { return settings_path_; }
  void set_settings_path(const std::filesystem::path& path) { settings_path_ = path; }

  nlohmann::json get_json() const { return values_; }

  static bool is_bool_literal(const std::string& value) { return parse_bool(value).has_value(); }

private:
  enum class Type { Bool, Int, String };

  struct Setting {
    std::string key;
    Type type = Type::String;
    std::optional<int> min;
  };

  static std::string lowered(std::string value);
  static std::string trimmed(const std::string& value);
  static std::optional<bool> parse_bool(const std::string& value);
  static Type type_from_name(const std::string& name);

  const Setting* find(const std::string& token) const;
  bool store(const Setting& setting, const nlohmann::json& value, std::string& error);

  std::vector<Setting> settings_;
  std::map<std::string, std::size_t> names_;  // lower-cased key or alias -> index
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path settings_path_;
};

// ---- implementation -------------------------------------------------------

inline SettingsManager::SettingsManager(const nlohmann::json& specification) {
  for(const auto& entry : specification) {
    Setting setting;
    setting.key = entry.at("key").get<std::string>();
    setting.type = type_from_name(entry.at("type").get<std::string>());
    if(entry.contains("min")) setting.min = entry.at("min").get<int>();

    const std::size_t index = settings_.size();
    names_[lowered(setting.key)] = index;
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      names_[lowered(alias)] = index;
    }
    values_[setting.key] = entry.at("default");
    settings_.push_back(std::move(setting));
  }
}

inline SettingsManager::Type SettingsManager::type_from_name(const std::string& name) {
  if(name == "bool") return Type::Bool;
  if(name == "int") return Type::Int;
  if(name == "string") return Type::String;
  throw std::invalid_argument("Unknown setting type '" + name + "'");
}

inline std::string SettingsManager::lowered(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trimmed(const std::string& value) {
  auto first = std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); });
  auto last = std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base();
  return first < last ? std::string(first, last) : std::string();
}

inline std::optional<bool> SettingsManager::parse_bool(const std::string& value) {
  const std::string v = lowered(trimmed(value));
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}

inline const SettingsManager::Setting* SettingsManager::find(const std::string& token) const {
  auto it = names_.find(lowered(token));
  return it == names_.end() ? nullptr : &settings_[it->second];
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* setting = find(token)) return setting->key;
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* setting = find(key);
  return setting && setting->type == Type::Bool;
}

inline bool SettingsManager::store(const Setting& setting, const nlohmann::json& value, std::string& error) {
  switch(setting.type) {
    case Type::Bool:
      if(!value.is_boolean()) {
        error = "expected boolean";
        return false;
      }
      break;
    case Type::Int:
      if(!value.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      if(value.is_number_unsigned()
           ? value.get<std::uint64_t>() > static_cast<std::uint64_t>(INT_MAX)
           : (value.get<std::int64_t>() < INT_MIN || value.get<std::int64_t>() > INT_MAX)) {
        error = "out of range";
        return false;
      }
      if(setting.min && value.get<int>() < *setting.min) {
        error = "must be at least " + std::to_string(*setting.min);
        return false;
      }
      break;
    case Type::String:
      if(!value.is_string()) {
        error = "expected string";
        return false;
      }
      break;
  }
  values_[setting.key] = value;
  return true;
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  error.clear();
  const auto* setting = find(key);
  if(!setting) {
    error = "unknown setting";
    return false;
  }
  const std::string clean = trimmed(value);
  switch(setting->type) {
    case Type::Bool: {
      auto parsed = parse_bool(clean);
      if(!parsed) {
        error = "expected boolean (true|false|on|off)";
        return false;
      }
      return store(*setting, *parsed, error);
    }
    case Type::Int: {
      int parsed = 0;
      try {
        std::size_t used = 0;
        parsed = std::stoi(clean, &used);
        if(used != clean.size()) {
          error = "expected integer";
          return false;
        }
      } catch(const std::exception&) {
        error = "expected integer";
        return false;
      }
      return store(*setting, parsed, error);
    }
    case Type::String:
      return store(*setting, clean, error);
  }
  return false;
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) {
    print_err("Unable to read {}", path.string());
    return false;
  }
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err("Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err("{} must contain a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* setting = find(item.key());
    if(!setting) {
      print_err("Ignoring unknown setting '{}' in {}", item.key(), path.string());
      continue;
    }
    std::string error;
    if(!store(*setting, item.value(), error)) {
      print_err("Ignoring setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!values_.contains(key)) {
    throw std::out_of_range("Unknown setting: " + key);
  }
  return values_.at(key).get<T>();
}
