#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "treesync",
                    nlohmann::json settings_spec = SETTINGS_SPECIFICATION,
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","source"}},
                      {{"index",1},{"key","replica"}},
                      {{"index",2},{"key","log_file"}},
                      {{"index",3},{"key","interval"}}
                    }));

  // Throws ConfigError on unknown options, bad values or a positional
  // count other than the one configured (unless --help was given).
  void parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage() const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec) const;
  std::size_t apply_tokens(const std::vector<std::string>& args, SettingsManager& settings) const;
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  nlohmann::json settings_spec_;
  nlohmann::json argv_spec_;
  std::vector<ArgvSpec> positional_specs_;
};
