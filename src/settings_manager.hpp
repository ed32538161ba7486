#pragma once

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"

// One row per setting. "min"/"max" bound integer settings; "persistent":false
// keeps a key out of get_json() (command-line only switches).
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","username"},             {"aliases", {"user","u"}},        {"type","string"}, {"default","WoxxyUser"},       {"description","Name announced to other peers"}},
  {{"key","download_dir"},         {"aliases", {"downloads","d"}},   {"type","string"}, {"default",""},                {"description","Where received files are stored (empty = ~/Downloads)"}},
  {{"key","avatar_path"},          {"aliases", {"avatar"}},          {"type","string"}, {"default",""},                {"description","Image sent to peers that ask for our avatar"}},
  {{"key","checksum_enabled"},     {"aliases", {"checksum","md5"}},  {"type","bool"},   {"default",true},              {"description","Send an MD5 digest with every file"}},
  {{"key","local_ip"},             {"aliases", {"ip"}},              {"type","string"}, {"default",""},                {"description","IPv4 address to announce (empty = auto-detect)"}},
  {{"key","transfer_port"},        {"aliases", {"tp","port"}},       {"type","int"},    {"default",8090},  {"min",0}, {"max",65535},      {"description","TCP port for incoming transfers"}},
  {{"key","discovery_port"},       {"aliases", {"dp"}},              {"type","int"},    {"default",8091},  {"min",0}, {"max",65535},      {"description","UDP port for announcements"}},
  {{"key","broadcast_address"},    {"aliases", {"broadcast"}},       {"type","string"}, {"default","255.255.255.255"}, {"description","Destination of presence broadcasts"}},
  {{"key","announce_interval_ms"}, {"aliases", {"announce"}},        {"type","int"},    {"default",5000},  {"min",100},               {"description","Milliseconds between announcements"}},
  {{"key","peer_timeout_s"},       {"aliases", {"timeout"}},         {"type","int"},    {"default",30},    {"min",1},                 {"description","Seconds of silence before a peer is dropped"}},
  {{"key","connect_timeout_ms"},   {"aliases", {"cto"}},             {"type","int"},    {"default",10000}, {"min",1},                 {"description","Bound on establishing an outbound connection"}},
  {{"key","ready_timeout_ms"},     {"aliases", {"rto"}},             {"type","int"},    {"default",5000},  {"min",0},                 {"description","How long a sender waits for the ready token"}},
  {{"key","chunk_size"},           {"aliases", {"chunk"}},           {"type","int"},    {"default",65536}, {"min",512}, {"max",16777216}, {"description","Bytes per socket read/write"}},
  {{"key","avatar_cache_dir"},     {"aliases", {"avatars"}},         {"type","string"}, {"default",""},                {"description","Avatar store (empty = <download_dir>/.woxxy/avatars)"}},
  {{"key","config"},               {"aliases", {"c"}},               {"type","string"}, {"default",""},                {"description","Settings file to read (empty = ~/.config/woxxy/settings.json)"}, {"persistent", false}},
  {{"key","verbose"},              {"aliases", {"v"}},               {"type","bool"},   {"default",false},             {"description","Enable verbose logging"}},
  {{"key","help"},                 {"aliases", {"h","?"}},           {"type","bool"},   {"default",false},             {"description","Show command help and exit"}, {"persistent", false}}
});

enum class SettingType { Bool, Int, String };

class SettingsManager {
public:
  struct Setting {
    std::string key;
    std::vector<std::string> aliases;  // lower-case
    SettingType type = SettingType::String;
    nlohmann::json default_value;
    std::optional<int64_t> min;
    std::optional<int64_t> max;
    std::string description;
    bool persistent = true;
  };

  SettingsManager() : SettingsManager(SETTINGS_SPECIFICATION) {}
  explicit SettingsManager(const nlohmann::json& table);

  template<typename T>
  T get(const std::string& key) const {
    if(!values_.contains(key)) throw std::runtime_error("Unknown setting: " + key);
    return values_.at(key).get<T>();
  }

  bool has(const std::string& key) const { return values_.contains(key); }
  bool help_requested() const { return get<bool>("help"); }

  // Both return false with error set and leave the stored value untouched.
  bool set_from_string(const std::string& key, const std::string& text, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  // Reads settings_path(). Unknown keys are skipped and invalid values are
  // reported and skipped; false only when the file is missing or not JSON.
  bool load() { return load_from_file(settings_path()); }
  bool load_from_file(const std::filesystem::path& path);

  std::filesystem::path settings_path() const {
    return settings_path_override_.empty() ? default_settings_path() : settings_path_override_;
  }
  void set_settings_path(const std::filesystem::path& path) { settings_path_override_ = path; }

  nlohmann::json get_json(bool persistent_only = true) const;

  const std::vector<Setting>& settings() const { return table_; }
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  std::string value_as_string(const std::string& key) const;
  std::string default_as_string(const std::string& key) const;

  static std::string render(const nlohmann::json& value);
  static bool is_bool_literal(const std::string& text);
  static std::string to_lower(std::string text);
  static std::string trim_copy(std::string text);
  static std::filesystem::path home_directory();
  static std::filesystem::path default_settings_path();

private:
  const Setting* find(const std::string& token) const;
  bool store(const Setting& setting, const nlohmann::json& value, std::string& error);
  static std::optional<bool> parse_bool(const std::string& text);

  std::vector<Setting> table_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path settings_path_override_;
};

// ---- implementation -------------------------------------------------------

inline SettingsManager::SettingsManager(const nlohmann::json& table) {
  for(const auto& row : table) {
    Setting s;
    s.key = row.at("key").get<std::string>();
    for(const auto& alias : row.value("aliases", std::vector<std::string>{})) {
      s.aliases.push_back(to_lower(alias));
    }
    auto type = row.at("type").get<std::string>();
    if(type == "bool") s.type = SettingType::Bool;
    else if(type == "int") s.type = SettingType::Int;
    else if(type == "string") s.type = SettingType::String;
    else throw std::runtime_error("Setting '" + s.key + "' has unsupported type '" + type + "'");
    s.default_value = row.at("default");
    if(row.contains("min")) s.min = row.at("min").get<int64_t>();
    if(row.contains("max")) s.max = row.at("max").get<int64_t>();
    s.description = row.value("description", "");
    s.persistent = row.value("persistent", true);
    values_[s.key] = s.default_value;
    table_.push_back(std::move(s));
  }
}

inline const SettingsManager::Setting* SettingsManager::find(const std::string& token) const {
  std::string wanted = to_lower(token);
  for(const auto& s : table_) {
    if(to_lower(s.key) == wanted) return &s;
    if(std::find(s.aliases.begin(), s.aliases.end(), wanted) != s.aliases.end()) return &s;
  }
  return nullptr;
}

inline bool SettingsManager::store(const Setting& setting, const nlohmann::json& value, std::string& error) {
  switch(setting.type) {
    case SettingType::Bool:
      // Config files written by hand often use 0/1.
      if(value.is_boolean()) {
        values_[setting.key] = value.get<bool>();
      } else if(value.is_number_integer()) {
        values_[setting.key] = value.get<int64_t>() != 0;
      } else {
        error = "expected boolean";
        return false;
      }
      return true;
    case SettingType::Int: {
      if(!value.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      auto n = value.get<int64_t>();
      if((setting.min && n < *setting.min) || (setting.max && n > *setting.max)) {
        error = fmt::format("{} is outside {}..{}", n,
                            setting.min ? std::to_string(*setting.min) : std::string(),
                            setting.max ? std::to_string(*setting.max) : std::string());
        return false;
      }
      values_[setting.key] = static_cast<int>(n);
      return true;
    }
    case SettingType::String:
      if(!value.is_string()) {
        error = "expected string";
        return false;
      }
      values_[setting.key] = value.get<std::string>();
      return true;
  }
  error = "unsupported type";
  return false;
}

inline std::optional<bool> SettingsManager::parse_bool(const std::string& text) {
  std::string v = to_lower(trim_copy(text));
  if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
  if(v == "false" || v == "0" || v == "off" || v == "no") return false;
  return std::nullopt;
}

inline bool SettingsManager::set_from_string(const std::string& key, const std::string& text, std::string& error) {
  error.clear();
  const auto* setting = find(key);
  if(!setting) {
    error = "unknown setting";
    return false;
  }
  std::string clean = trim_copy(text);
  switch(setting->type) {
    case SettingType::Bool: {
      auto b = parse_bool(clean);
      if(!b) {
        error = "expected boolean (true|false|on|off)";
        return false;
      }
      return store(*setting, *b, error);
    }
    case SettingType::Int: {
      std::size_t used = 0;
      long long n = 0;
      try {
        n = std::stoll(clean, &used);
      } catch(const std::exception&) {
        used = 0;
      }
      if(clean.empty() || used != clean.size()) {
        error = "expected integer, got '" + clean + "'";
        return false;
      }
      return store(*setting, static_cast<int64_t>(n), error);
    }
    case SettingType::String:
      return store(*setting, clean, error);
  }
  error = "unsupported type";
  return false;
}

inline bool SettingsManager::set_from_json(const std::string& key, const nlohmann::json& value, std::string& error) {
  error.clear();
  const auto* setting = find(key);
  if(!setting) {
    error = "unknown setting";
    return false;
  }
  return store(*setting, value, error);
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc = nlohmann::json::parse(in, nullptr, false);
  if(doc.is_discarded() || !doc.is_object()) {
    print_err("Failed to parse {}: not a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* setting = find(item.key());
    if(!setting) continue;
    std::string error;
    if(!store(*setting, item.value(), error)) {
      print_err("Ignoring invalid setting '{}' in {}: {}", item.key(), path.string(), error);
    }
  }
  return true;
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& s : table_) {
    if(persistent_only && !s.persistent) continue;
    doc[s.key] = values_.at(s.key);
  }
  return doc;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* s = find(token)) return s->key;
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* s = find(key);
  return s && s->type == SettingType::Bool;
}

inline std::string SettingsManager::render(const nlohmann::json& value) {
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  return value.dump();
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  return has(key) ? render(values_.at(key)) : "<unknown>";
}

inline std::string SettingsManager::default_as_string(const std::string& key) const {
  const auto* s = find(key);
  return s ? render(s->default_value) : "";
}

inline bool SettingsManager::is_bool_literal(const std::string& text) {
  return parse_bool(text).has_value();
}

inline std::string SettingsManager::to_lower(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return text;
}

inline std::string SettingsManager::trim_copy(std::string text) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  text.erase(text.begin(), std::find_if(text.begin(), text.end(), not_space));
  text.erase(std::find_if(text.rbegin(), text.rend(), not_space).base(), text.end());
  return text;
}

inline std::filesystem::path SettingsManager::home_directory() {
  if(const char* home = std::getenv("HOME"); home && *home) return home;
  if(const char* profile = std::getenv("USERPROFILE"); profile && *profile) return profile;
  return std::filesystem::current_path();
}

inline std::filesystem::path SettingsManager::default_settings_path() {
  return home_directory() / ".config" / "woxxy" / "settings.json";
}
