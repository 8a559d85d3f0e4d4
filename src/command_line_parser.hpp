#pragma once

#include <string>
#include <vector>

#include "settings_manager.hpp"

namespace docsync {

class CommandLineParser {
public:
  CommandLineParser(std::string process_name = "docsync",
                    nlohmann::json argv_spec = nlohmann::json::array({
                      {{"index",0},{"key","command"}},
                      {{"index",1},{"key","arg1"}},
                      {{"index",2},{"key","arg2"}}
                    }));

  // Prints the problem and usage on failure.
  bool parse(int argc, char* argv[], SettingsManager& settings) const;
  void usage(const SettingsManager& settings) const;

private:
  struct ArgvSpec {
    std::size_t index = 0;
    std::string key;
  };

  static std::vector<ArgvSpec> build_positional_specs(const nlohmann::json& spec);
  static bool is_option_token(const std::string& candidate);

  std::string process_name_;
  std::vector<ArgvSpec> positional_specs_;
};

} // namespace docsync
