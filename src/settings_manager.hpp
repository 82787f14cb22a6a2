#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "errors.hpp"
#include "log.hpp"

// Participant settings. "min" bounds integer values; "list" values are
// arrays of strings, given on the command line as comma-separated text.
inline const nlohmann::json SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","role"},                   {"aliases", {"r"}},                 {"type","string"}, {"default",""},                    {"description","create (share this workspace) or join (mirror a peer)"}, {"persistent", false}},
  {{"key","peer"},                   {"aliases", {"p","target"}},        {"type","string"}, {"default",""},                    {"description","Session id of the participant to connect to"}, {"persistent", false}},
  {{"key","relay_url"},              {"aliases", {"relay","url"}},       {"type","string"}, {"default","ws://127.0.0.1:6789"}, {"description","WebSocket URL of the relay"}, {"persistent", true}},
  {{"key","username"},               {"aliases", {"u","name"}},          {"type","string"}, {"default",""},                    {"description","Name shown to the other participant (random when empty)"}, {"persistent", true}},
  {{"key","workspace"},              {"aliases", {"w","root"}},          {"type","string"}, {"default",""},                    {"description","Directory to share (current directory when empty)"}, {"persistent", true}},
  {{"key","scratch_dir"},            {"aliases", {"scratch"}},           {"type","string"}, {"default",""},                    {"description","Where received files are written (temp directory when empty)"}, {"persistent", true}},
  {{"key","stun_server"},            {"aliases", {"stun"}},              {"type","string"}, {"default","stun:stun.l.google.com:19302"}, {"description","STUN server used for ICE"}, {"persistent", true}},
  {{"key","poll_interval_ms"},       {"aliases", {"poll"}},              {"type","int"},    {"default",5000},  {"min",1},        {"description","Workspace change polling interval"}, {"persistent", true}},
  {{"key","negotiation_timeout_ms"}, {"aliases", {"nt"}},                {"type","int"},    {"default",30000}, {"min",1},        {"description","Give up on a peer connection after this long"}, {"persistent", true}},
  {{"key","transfer_timeout_ms"},    {"aliases", {"tt"}},                {"type","int"},    {"default",60000}, {"min",1},        {"description","Drop partial transfers idle this long"}, {"persistent", true}},
  {{"key","history_cache_bytes"},    {"aliases", {"cache"}},             {"type","int"},    {"default",67108864}, {"min",0},     {"description","Bytes of file content kept for rollback"}, {"persistent", true}},
  {{"key","exclude"},                {"aliases", {"x","ignore"}},        {"type","list"},   {"default",nlohmann::json::array()}, {"description","Extra gitignore-style exclude patterns"}, {"persistent", true}},
  {{"key","verbose"},                {"aliases", {"v"}},                 {"type","bool"},   {"default",false},                 {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},                   {"aliases", {"h","?"}},             {"type","bool"},   {"default",false},                 {"description","Show command help and exit"}, {"persistent", false}},
  {{"key","save"},                   {"aliases", {"persist"}},           {"type","bool"},   {"default",false},                 {"description","Persist current settings to disk"}, {"persistent", false}}
});

inline const nlohmann::json RELAY_SETTINGS_SPECIFICATION = nlohmann::json::array({
  {{"key","listen_ip"},   {"aliases", {"li","bind"}}, {"type","string"}, {"default","0.0.0.0"}, {"description","Interface/IP to bind"}, {"persistent", true}},
  {{"key","listen_port"}, {"aliases", {"lp","port"}}, {"type","int"},    {"default",6789}, {"min",1}, {"description","WebSocket port to listen on"}, {"persistent", true}},
  {{"key","verbose"},     {"aliases", {"v"}},         {"type","bool"},   {"default",false},     {"description","Enable verbose logging"}, {"persistent", true}},
  {{"key","help"},        {"aliases", {"h","?"}},     {"type","bool"},   {"default",false},     {"description","Show command help and exit"}, {"persistent", false}}
});

class SettingsManager {
public:
  SettingsManager();
  explicit SettingsManager(const nlohmann::json& specification);

  // Throws ConfigError for keys outside the specification.
  template<typename T>
  T get(const std::string& key) const;

  bool has(const std::string& key) const;

  bool set_from_string(const std::string& key, const std::string& value, std::string& error);
  bool set_from_json(const std::string& key, const nlohmann::json& value, std::string& error);

  bool save() const;
  bool load();
  bool save_to_file(const std::filesystem::path& path) const;
  bool load_from_file(const std::filesystem::path& path);

  bool save_requested() const { return has("save") && get<bool>("save"); }
  bool help_requested() const { return has("help") && get<bool>("help"); }

  std::vector<std::string> keys() const;
  std::string value_as_string(const std::string& key) const;
  std::optional<std::string> resolve_key(const std::string& token) const;
  bool is_bool_setting(const std::string& key) const;

  std::filesystem::path settings_path() const;
  void set_settings_path(const std::filesystem::path& path);

  nlohmann::json get_json(bool persistent_only = true) const;

  static std::string to_lower(std::string value);
  static std::string trim_copy(std::string value);
  static bool is_bool_literal(const std::string& value);

private:
  enum class ValueType { Bool, Int, String, List };

  struct SettingSpec {
    std::string key;
    std::vector<std::string> aliases;
    ValueType type = ValueType::String;
    nlohmann::json default_value;
    std::optional<long long> min;
    bool persistent = true;
  };

  static std::vector<SettingSpec> build_setting_specs(const nlohmann::json& specification);
  static ValueType parse_type(const std::string& name);

  const SettingSpec* find_spec(const std::string& token) const;
  void merge_from_json(const nlohmann::json& doc);
  bool store(const SettingSpec& spec, const nlohmann::json& value, std::string& error);
  std::optional<nlohmann::json> parse_text(const SettingSpec& spec, const std::string& text,
                                           std::string& error) const;

  nlohmann::json values_ = nlohmann::json::object();
  std::vector<SettingSpec> specs_;
  std::filesystem::path settings_path_;
};

// ---- implementation -------------------------------------------------------

inline SettingsManager::ValueType SettingsManager::parse_type(const std::string& name) {
  if(name == "bool") return ValueType::Bool;
  if(name == "int") return ValueType::Int;
  if(name == "string") return ValueType::String;
  if(name == "list") return ValueType::List;
  throw ConfigError("unsupported setting type '" + name + "'");
}

inline std::vector<SettingsManager::SettingSpec> SettingsManager::build_setting_specs(const nlohmann::json& specification) {
  std::vector<SettingSpec> result;
  for(const auto& entry : specification) {
    SettingSpec spec;
    spec.key = entry.at("key").get<std::string>();
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      spec.aliases.push_back(to_lower(alias));
    }
    spec.type = parse_type(entry.at("type").get<std::string>());
    spec.default_value = entry.at("default");
    if(entry.contains("min")) spec.min = entry.at("min").get<long long>();
    spec.persistent = entry.value("persistent", true);
    result.push_back(std::move(spec));
  }
  return result;
}

inline SettingsManager::SettingsManager()
  : SettingsManager(SETTINGS_SPECIFICATION) {}

inline SettingsManager::SettingsManager(const nlohmann::json& specification)
  : specs_(build_setting_specs(specification)) {
  for(const auto& spec : specs_) {
    values_[spec.key] = spec.default_value;
  }
}

inline const SettingsManager::SettingSpec* SettingsManager::find_spec(const std::string& token) const {
  std::string lowered = to_lower(token);
  std::replace(lowered.begin(), lowered.end(), '-', '_');
  for(const auto& spec : specs_) {
    if(lowered == spec.key) return &spec;
    if(std::find(spec.aliases.begin(), spec.aliases.end(), lowered) != spec.aliases.end()) {
      return &spec;
    }
  }
  return nullptr;
}

inline bool SettingsManager::has(const std::string& key) const {
  return values_.contains(key);
}

inline std::vector<std::string> SettingsManager::keys() const {
  std::vector<std::string> out;
  for(const auto& spec : specs_) out.push_back(spec.key);
  return out;
}

inline std::string SettingsManager::value_as_string(const std::string& key) const {
  if(!has(key)) return "<unknown>";
  const auto& value = values_.at(key);
  if(value.is_string()) return value.get<std::string>();
  if(value.is_boolean()) return value.get<bool>() ? "true" : "false";
  if(value.is_array()) {
    std::string joined;
    for(const auto& item : value) {
      if(!joined.empty()) joined += ",";
      joined += item.get<std::string>();
    }
    return joined;
  }
  return value.dump();
}

inline void SettingsManager::set_settings_path(const std::filesystem::path& path) {
  settings_path_ = path;
}

inline std::filesystem::path SettingsManager::settings_path() const {
  if(!settings_path_.empty()) return settings_path_;
  return std::filesystem::current_path() / ".tightrope" / "settings.json";
}

inline bool SettingsManager::load() {
  return load_from_file(settings_path());
}

inline bool SettingsManager::save() const {
  return save_to_file(settings_path());
}

inline bool SettingsManager::load_from_file(const std::filesystem::path& path) {
  if(path.empty()) return false;
  std::ifstream in(path);
  if(!in) return false;
  try {
    nlohmann::json doc;
    in >> doc;
    merge_from_json(doc);
    return true;
  } catch(const nlohmann::json::exception& e) {
    print_err(nullptr, "Failed to parse {}: {}", path.string(), e.what());
    return false;
  }
}

inline bool SettingsManager::save_to_file(const std::filesystem::path& path) const {
  if(path.empty()) return false;
  std::error_code ec;
  if(path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
  }
  std::ofstream out(path);
  if(!out) {
    print_err(nullptr, "Unable to write {}", path.string());
    return false;
  }
  out << get_json(true).dump(2);
  return static_cast<bool>(out);
}

inline void SettingsManager::merge_from_json(const nlohmann::json& doc) {
  if(!doc.is_object()) return;
  for(const auto& item : doc.items()) {
    const auto* spec = find_spec(item.key());
    if(!spec) continue;
    std::string error;
    if(!store(*spec, item.value(), error)) {
      print_err(nullptr, "Ignoring invalid setting '{}': {}", item.key(), error);
    }
  }
}

inline nlohmann::json SettingsManager::get_json(bool persistent_only) const {
  nlohmann::json doc = nlohmann::json::object();
  for(const auto& spec : specs_) {
    if(persistent_only && !spec.persistent) continue;
    doc[spec.key] = values_.at(spec.key);
  }
  return doc;
}

inline bool SettingsManager::store(const SettingSpec& spec,
                                   const nlohmann::json& value,
                                   std::string& error) {
  switch(spec.type) {
    case ValueType::Bool:
      if(value.is_boolean()) {
        values_[spec.key] = value.get<bool>();
        return true;
      }
      error = "expected boolean";
      return false;
    case ValueType::Int: {
      if(!value.is_number_integer()) {
        error = "expected integer";
        return false;
      }
      auto number = value.get<long long>();
      if(spec.min && number < *spec.min) {
        error = "must be at least " + std::to_string(*spec.min);
        return false;
      }
      values_[spec.key] = number;
      return true;
    }
    case ValueType::String:
      if(value.is_string()) {
        values_[spec.key] = value.get<std::string>();
        return true;
      }
      error = "expected string";
      return false;
    case ValueType::List:
      if(value.is_array() && std::all_of(value.begin(), value.end(),
                                         [](const nlohmann::json& v){ return v.is_string(); })) {
        values_[spec.key] = value;
        return true;
      }
      error = "expected a list of strings";
      return false;
  }
  error = "unknown type";
  return false;
}

inline std::optional<nlohmann::json> SettingsManager::parse_text(const SettingSpec& spec,
                                                                 const std::string& text,
                                                                 std::string& error) const {
  std::string clean = trim_copy(text);
  switch(spec.type) {
    case ValueType::Bool: {
      std::string v = to_lower(clean);
      if(v == "true" || v == "1" || v == "on" || v == "yes") return nlohmann::json(true);
      if(v == "false" || v == "0" || v == "off" || v == "no") return nlohmann::json(false);
      error = "expected boolean (true|false|on|off)";
      return std::nullopt;
    }
    case ValueType::Int: {
      std::size_t used = 0;
      try {
        long long number = std::stoll(clean, &used);
        if(used == clean.size()) return nlohmann::json(number);
      } catch(const std::logic_error&) {
      }
      error = "expected integer";
      return std::nullopt;
    }
    case ValueType::String:
      return nlohmann::json(clean);
    case ValueType::List: {
      nlohmann::json items = nlohmann::json::array();
      std::size_t start = 0;
      while(start <= clean.size()) {
        auto comma = clean.find(',', start);
        auto item = trim_copy(clean.substr(start, comma == std::string::npos ? std::string::npos : comma - start));
        if(!item.empty()) items.push_back(item);
        if(comma == std::string::npos) break;
        start = comma + 1;
      }
      return items;
    }
  }
  error = "unsupported type";
  return std::nullopt;
}

inline bool SettingsManager::set_from_string(const std::string& key,
                                             const std::string& value,
                                             std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  auto parsed = parse_text(*spec, value, error);
  if(!parsed) return false;
  return store(*spec, *parsed, error);
}

inline bool SettingsManager::set_from_json(const std::string& key,
                                           const nlohmann::json& value,
                                           std::string& error) {
  const auto* spec = find_spec(key);
  if(!spec) {
    error = "unknown setting";
    return false;
  }
  error.clear();
  return store(*spec, value, error);
}

inline std::string SettingsManager::to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch){ return static_cast<char>(std::tolower(ch)); });
  return value;
}

inline std::string SettingsManager::trim_copy(std::string value) {
  value.erase(value.begin(), std::find_if(value.begin(), value.end(),
    [](unsigned char ch){ return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
    [](unsigned char ch){ return !std::isspace(ch); }).base(), value.end());
  return value;
}

inline bool SettingsManager::is_bool_literal(const std::string& value) {
  std::string lowered = to_lower(trim_copy(value));
  return lowered == "true" || lowered == "false" ||
         lowered == "on" || lowered == "off" ||
         lowered == "1" || lowered == "0" ||
         lowered == "yes" || lowered == "no";
}

inline std::optional<std::string> SettingsManager::resolve_key(const std::string& token) const {
  if(const auto* spec = find_spec(token)) return spec->key;
  return std::nullopt;
}

inline bool SettingsManager::is_bool_setting(const std::string& key) const {
  const auto* spec = find_spec(key);
  return spec && spec->type == ValueType::Bool;
}

template<typename T>
inline T SettingsManager::get(const std::string& key) const {
  if(!has(key)) {
    throw ConfigError("unknown setting '" + key + "'");
  }
  try {
    return values_.at(key).get<T>();
  } catch(const nlohmann::json::exception& e) {
    throw ConfigError("setting '" + key + "' has the wrong type: " + e.what());
  }
}
