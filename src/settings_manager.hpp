#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "log.hpp"
#include "utils.hpp"

namespace docsync {

// Types: "string", "path" (relative values resolve against the workspace),
// "int" (optional "min"), "bool", "schedule" (comma separated seconds).
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","store_root"},                {"aliases", {"root","sr"}},   {"type","path"},     {"default","store"},     {"description","Directory holding one sub-directory per container"}, {"persistent", true}},
  {{"key","container"},                 {"aliases", {"c","ctr"}},     {"type","string"},   {"default","default"},   {"description","Container identifier"}, {"persistent", true}},
  {{"key","idle_schedule"},             {"aliases", {"idle"}},        {"type","schedule"}, {"default","60,90,180"}, {"description","Idle timeout per read attempt, seconds"}, {"persistent", true}},
  {{"key","backoff_schedule"},          {"aliases", {"backoff"}},     {"type","schedule"}, {"default","2,4"},       {"description","Delay between read attempts, seconds"}, {"persistent", true}},
  {{"key","download_idle_schedule"},    {"aliases", {"didle"}},       {"type","schedule"}, {"default","60,90,180"}, {"description","Idle timeout per download attempt, seconds"}, {"persistent", true}},
  {{"key","download_backoff_schedule"}, {"aliases", {"dbackoff"}},    {"type","schedule"}, {"default","2,4"},       {"description","Delay between download attempts, seconds"}, {"persistent", true}},
  {{"key","query_timeout_s"},           {"aliases", {"qt"}},          {"type","int"},      {"default",30}, {"min",1}, {"description","Seconds before a metadata lookup gives up"}, {"persistent", true}},
  {{"key","query_warning_s"},           {"aliases", {"qw"}},          {"type","int"},      {"default",10}, {"min",0}, {"description","Seconds before a slow metadata lookup is logged"}, {"persistent", true}},
  {{"key","copy_buffer_kb"},            {"aliases", {"buffer"}},      {"type","int"},      {"default",64}, {"min",1}, {"description","Stream copy buffer size in KiB"}, {"persistent", true}},
  {{"key","auto_materialize"},          {"aliases", {"am"}},          {"type","bool"},     {"default",true},        {"description","Local store completes downloads as soon as they are requested"}, {"persistent", true}},
  {{"key","auto_upload"},               {"aliases", {"au"}},          {"type","bool"},     {"default",true},        {"description","Local store reports writes as uploaded immediately"}, {"persistent", true}},
  {{"key","verbose"},                   {"aliases", {"v"}},           {"type","bool"},     {"default",false},       {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","watch"},                     {"aliases", {"w"}},           {"type","bool"},     {"default",false},       {"description","Keep 'list' running and print every change"}, {"persistent", false}},
  {{"key","progress"},                  {"aliases", {"p"}},           {"type","bool"},     {"default",true},        {"description","Print transfer progress for upload/download"}, {"persistent", true}},
  {{"key","command"},                   {"aliases", {"cmd"}},         {"type","string"},   {"default",""},          {"description","Command to run"}, {"persistent", false}},
  {{"key","arg1"},                      {"aliases", nlohmann::json::array()}, {"type","string"}, {"default",""},    {"description","First command argument"}, {"persistent", false}},
  {{"key","arg2"},                      {"aliases", nlohmann::json::array()}, {"type","string"}, {"default",""},    {"description","Second command argument"}, {"persistent", false}},
  {{"key","help"},                      {"aliases", {"h","?"}},       {"type","bool"},     {"default",false},       {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                      {"aliases", {"persist"}},     {"type","bool"},     {"default",false},       {"description","Persist current settings to disk"}, {"persistent", false}}
});

// Typed settings backed by a JSON document. Every value is checked against
// its definition when it is set, so readers never see a malformed schedule
// or an out-of-range number.
class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  template<typename T>
  T get(const std::string& key) const;
  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool load();
  bool save() const;
  bool load_from_file(const std::filesystem::path& path);
  bool save_to_file(const std::filesystem::path& path) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  bool save_requested() const { return get<bool>("save"); }
  bool help_requested() const { return get<bool>("help"); }

  std::vector<std::chrono::milliseconds> get_schedule(const std::string& key, std::string& error) const;
  // Relative values are resolved against base.
  std::filesystem::path get_path(const std::string& key, const std::filesystem::path& base) const;

  // Only the persistent settings unless told otherwise.
  nlohmann::json to_json(bool persistent_only = true) const;

  std::vector<std::string> keys() const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;
  std::string type_of(const std::string& key) const;
  std::string description_of(const std::string& key) const;
  std::vector<std::string> aliases_of(const std::string& key) const;
  std::string default_as_string(const std::string& key) const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  struct Definition {
    std::string key;
    std::vector<std::string> aliases;
    std::string type;
    nlohmann::json default_value;
    std::optional<long long> min;
    std::string description;
    bool persistent = true;
  };

  static std::vector<Definition> parse_definitions(const nlohmann::json& specification);
  const Definition* find(const std::string& token) const;

  // Converts a command-line token into the JSON value store() expects.
  static nlohmann::json from_token(const Definition& def, const std::string& token, std::string& error);
  bool store(const Definition& def, const nlohmann::json& value, std::string& error);

  std::vector<Definition> definitions_;
  nlohmann::json values_ = nlohmann::json::object();
  std::filesystem::path settings_path_;
};

// ---- implementation -------------------------------------------------------

inline std::vector<SettingsManager::Definition> SettingsManager::parse_definitions(const nlohmann::json& specification) {
  std::vector<Definition> out;
  for(const auto& entry : specification) {
    Definition def;
    def.key = entry.at("key").get<std::string>();
    for(const auto& alias : entry.value("aliases", nlohmann::json::array())) {
      def.aliases.push_back(to_lower(alias.get<std::string>()));
    }
    def.type = entry.at("type").get<std::string>();
    def.default_value = entry.at("default");
    if(entry.contains("min")) def.min = entry.at("min").get<long long>();
    def.description = entry.value("description", "");
    def.persistent = entry.value("persistent", true);
    out.push_back(std::move(def));
  }
  return out;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : definitions_(parse_definitions(specification)) {
  for(const auto& def : definitions_) values_[def.key] = def.default_value;
}

inline const SettingsManager::Definition* SettingsManager::find(const std::string& token) const {
  auto lowered = to_lower(token);
  for(const auto& def : definitions_) {
    if(to_lower(def.key) == lowered) return &def;
    if(std::find(def.aliases.begin(), def.aliases.end(), lowered) != def.aliases.end()) return &def;
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return values_.contains(key);
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw std::runtime_error("Unknown setting: " + key);
  }
  return values_.at(key).get<T>();
}

inline nlohmann::json SettingsManager::from_token(const Definition& def, const std::string& token, std::string& error) {
  auto clean = trim_copy(token);
  if(def.type == "bool") {
    auto v = to_lower(clean);
    if(v == "true" || v == "1" || v == "on" || v == "yes") return true;
    if(v == "false" || v == "0" || v == "off" || v == "no") return false;
    error = "expected boolean (true|false|on|off)";
    return {};
  }
  if(def.type == "int") {
    try {
      std::size_t used = 0;
      long long n = std::stoll(clean, &used);
      if(used != clean.size()) throw std::invalid_argument(clean);
      return n;
    } catch(const std::exception&) {
      error = "expected integer, got '" + clean + "'";
      return {};
    }
  }
  return clean;
}

inline bool SettingsManager::store(const Definition& def, const nlohmann::json& value, std::string& error) {
  if(def.type == "bool") {
    if(value.is_boolean()) {
      values_[def.key] = value.get<bool>();
      return true;
    }
    if(value.is_number_integer()) {
      values_[def.key] = value.get<long long>() != 0;
      return true;
    }
    error = "expected boolean";
    return false;
  }

  if(def.type == "int") {
    if(!value.is_number_integer()) {
      error = "expected integer";
      return false;
    }
    auto n = value.get<long long>();
    if(def.min && n < *def.min) {
      error = "must be at least " + std::to_string(*def.min);
      return false;
    }
    values_[def.key] = n;
    return true;
  }

  if(!value.is_string()) {
    error = "expected string";
    return false;
  }
  auto text = value.get<std::string>();
  if(def.type == "schedule") {
    parse_schedule(text, error);
    if(!error.empty()) return false;
  } else if(def.type == "path" && text.empty()) {
    error = "path must not be empty";
    return false;
  }
  values_[def.key] = text;
  return true;
}

inline bool SettingsManager::set_from_string(const std::string& key, const std::string& value, std::string& error) {
  error.clear();
  const auto* def = find(key);
  if(!def) {
    error = "unknown setting";
    return false;
  }
  auto parsed = from_token(*def, value, error);
  if(!error.empty()) return false;
  return store(*def, parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key, const nlohmann::json& value, std::string& error) {
  error.clear();
  const auto* def = find(key);
  if(!def) {
    error = "unknown setting";
    return false;
  }
  return store(*def, value, error);
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_.empty()) return settings_path_;
  return std::filesystem::current_path() / ".config" / "docsync.json";
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_ = path;
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  std::ifstream in(path);
  if(!in) return false;
  nlohmann::json doc;
  try {
    in >> doc;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
  if(!doc.is_object()) {
    print_err(nullptr, "Ignoring {}: expected a JSON object", path.string());
    return false;
  }
  for(const auto& item : doc.items()) {
    const auto* def = find(item.key());
    if(!def || !def->persistent) {
      log_debug(nullptr, "Ignoring setting '{}' from {}", item.key(), path.string());
      continue;
    }
    std::string error;
    if(!store(*def, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
  return true;
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  std::error_code ec;
  if(path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << to_json(true).dump(2) << "\n";
  return static_cast<bool>(out);
}

inline std::vector<std::chrono::milliseconds> SettingsManager::get_schedule(const std::string& key,
                                                                            std::string& error) const {
  auto schedule = parse_schedule(get<std::string>(key), error);
  if(!error.empty()) error = key + ": " + error;
  return schedule;
}

inline std::filesystem::path SettingsManager::get_path(const std::string& key,
                                                       const std::filesystem::path& base) const {
  std::filesystem::path value = get<std::string>(key);
  if(value.is_absolute()) return value;
  return base / value;
}

inline nlohmann::json SettingsManager::to_json(bool persistent_only) const {
  auto doc = nlohmann::json::object();
  for(const auto& def : definitions_) {
    if(persistent_only && !def.persistent) continue;
    doc[def.key] = values_.at(def.key);
  }
  return doc;
}

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  for(const auto& def : definitions_) out.push_back(def.key);
  return out;
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* def = find(token)) return def->key;
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* def = find(key);
  return def && def->type == "bool";
}

inline std::string SettingsManager::type_of(const std::string& key) const {
  const auto* def = find(key);
  return def ? def->type : std::string();
}

inline std::string SettingsManager::description_of(const std::string& key) const {
  const auto* def = find(key);
  return def ? def->description : std::string();
}

inline std::vector<std::string> SettingsManager::aliases_of(const std::string& key) const {
  const auto* def = find(key);
  return def ? def->aliases : std::vector<std::string>();
}

inline std::string SettingsManager::default_as_string(const std::string& key) const {
  const auto* def = find(key);
  if(!def) return {};
  if(def->default_value.is_string()) return def->default_value.get<std::string>();
  return def->default_value.dump();
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  auto not_space = [](unsigned char ch){ return !std::isspace(ch); };
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), not_space));
  value.erase(std::find_if(value.rbegin(), value.rend(), not_space).base(), value.end());
  return value;
}

inline bool SettingsManager::is_bool_literal(const std::string& value) {
  std::string error;
  from_token(Definition{"", {}, "bool", false, std::nullopt, "", true}, value, error);
  return error.empty();
}

} // namespace docsync
