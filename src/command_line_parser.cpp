#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>

#include "errors.hpp"
#include "log.hpp"

CommandLineParser::CommandLineParser(std::string process_name,
                                     std::string summary,
                                     nlohmann::json settings_spec,
                                     nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    summary_(std::move(summary)),
    settings_spec_(std::move(settings_spec)),
    positional_specs_(build_positional_specs(argv_spec)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) const {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    result.push_back(ArgvSpec{entry.at("index").get<std::size_t>(), entry.at("key").get<std::string>()});
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });

  SettingsManager probe(settings_spec_);
  for(const auto& argv_entry : result) {
    if(!probe.resolve_key(argv_entry.key)) {
      throw ConfigError("argv specification references unknown setting '" + argv_entry.key + "'");
    }
  }
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

void CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  parse(args, settings);
}

void CommandLineParser::parse(const std::vector<std::string>& args, SettingsManager& settings) const {
  std::size_t positional_index = 0;

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    // Returns false for an unknown short alias so it can be taken as a
    // positional instead.
    auto handle_option = [&](const std::string& key_token, bool long_form){
      auto resolved = settings.resolve_key(key_token);
      if(!resolved) {
        if(long_form) throw ConfigError("unknown option --" + key_token);
        return false;
      }
      std::string value;
      if(settings.is_bool_setting(*resolved)) {
        if(i + 1 < args.size() && !is_option_token(args[i + 1]) &&
           SettingsManager::is_bool_literal(args[i + 1])) {
          value = args[++i];
        } else {
          value = "true";
        }
      } else {
        if(i + 1 >= args.size()) {
          throw ConfigError("missing value for option '" + key_token + "'");
        }
        value = args[++i];
      }
      std::string error;
      if(!settings.set_from_string(*resolved, value, error)) {
        throw ConfigError("invalid value for option '" + key_token + "': " + error);
      }
      return true;
    };

    if(token.rfind("--", 0) == 0) {
      auto body = token.substr(2);
      auto eq = body.find('=');
      if(eq != std::string::npos) {
        auto resolved = settings.resolve_key(body.substr(0, eq));
        if(!resolved) throw ConfigError("unknown option --" + body.substr(0, eq));
        std::string error;
        if(!settings.set_from_string(*resolved, body.substr(eq + 1), error)) {
          throw ConfigError("invalid value for option '" + body.substr(0, eq) + "': " + error);
        }
        continue;
      }
      handle_option(body, true);
      continue;
    }

    if(token.size() > 1 && token[0] == '-' && handle_option(token.substr(1), false)) {
      continue;
    }

    if(positional_index >= positional_specs_.size()) {
      throw ConfigError("unexpected argument '" + token + "'");
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string error;
    if(!settings.set_from_string(spec.key, token, error)) {
      throw ConfigError("invalid value for " + spec.key + " '" + token + "': " + error);
    }
  }
}

namespace {

std::string describe_default(const nlohmann::json& value) {
  if(value.is_boolean()) return value.get<bool>() ? "on" : "off";
  if(value.is_string()) {
    auto text = value.get<std::string>();
    return text.empty() ? "none" : text;
  }
  if(value.is_array()) {
    if(value.empty()) return "none";
    std::string joined;
    for(const auto& item : value) {
      if(!joined.empty()) joined += ",";
      joined += item.get<std::string>();
    }
    return joined;
  }
  return value.dump();
}

} // namespace

void CommandLineParser::usage() const {
  std::string synopsis = process_name_;
  for(const auto& pos : positional_specs_) synopsis += " <" + pos.key + ">";
  print_out(nullptr, "{}: {}", process_name_, summary_);
  print_out(nullptr, "");
  print_out(nullptr, "  {} [--option value ...]", synopsis);

  if(!positional_specs_.empty()) {
    print_out(nullptr, "");
    for(const auto& pos : positional_specs_) {
      for(const auto& entry : settings_spec_) {
        if(entry.at("key") != pos.key) continue;
        print_out(nullptr, "  <{}>  {}", pos.key, entry.value("description", ""));
      }
    }
  }

  print_out(nullptr, "");
  for(const auto& entry : settings_spec_) {
    auto key = entry.at("key").get<std::string>();
    bool positional = std::any_of(positional_specs_.begin(), positional_specs_.end(),
                                  [&](const ArgvSpec& p){ return p.key == key; });
    if(positional) continue;

    std::string flags = "--" + key;
    for(const auto& alias : entry.value("aliases", std::vector<std::string>{})) {
      flags += (alias.size() == 1 ? ", -" : ", --") + alias;
    }
    const bool is_flag = entry.at("type") == "bool";
    print_out(nullptr, "  {:<40} {}", flags + (is_flag ? "" : " <" + entry.at("type").get<std::string>() + ">"),
              entry.value("description", ""));
    if(!is_flag) {
      print_out(nullptr, "  {:<40} default: {}", "", describe_default(entry.at("default")));
    }
  }
  if(std::any_of(positional_specs_.begin(), positional_specs_.end(),
                 [](const ArgvSpec& p){ return p.key == "role"; })) {
    print_out(nullptr, "");
    print_out(nullptr, "  {} create --workspace ~/project", process_name_);
    print_out(nullptr, "  {} join <session id> --relay ws://relay.example:6789", process_name_);
  }
  print_out(nullptr, "");
}
