#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

// Maps argv onto a SettingsManager: "--key value", "-alias value", bare
// boolean flags and positional arguments in the order of argv_spec.
class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "tightrope",
                    std::string summary = "collaborative session",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","role"}},
                      {{"index",1},{"key","peer"}}
                    }));

  // Throws ConfigError on unknown options, missing or invalid values and
  // surplus positionals.
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void parse(const std::vector<std::string>& args, SettingsManager& settings) const;
  void usage() const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  std::string summary_;
  nlohmann::json settings_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
