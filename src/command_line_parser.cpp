#include "command_line_parser.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "log.hpp"

namespace docsync {

namespace {

const char* const kCommandHelp[][2] = {
  {"available", "Report whether the store is reachable"},
  {"path", "Print the container's local root"},
  {"list", "List every item in the container (--watch to follow changes)"},
  {"upload <local> <remote>", "Copy a local file into the container"},
  {"download <remote> <local>", "Wait for an item to materialize and copy it out"},
  {"read <remote>", "Print an item's content once it is materialized"},
  {"write <remote> <text>", "Replace an item's content"},
  {"exists <path>", "Report whether an item exists"},
  {"metadata <path>", "Print an item's metadata"},
  {"delete <path>", "Remove an item"},
  {"move <from> <to>", "Move an item, creating parent directories"},
  {"copy <from> <to>", "Copy an item, replacing the destination"},
};

} // namespace

CommandLineParser::CommandLineParser(std::string process_name, nlohmann::json argv_spec)
  : process_name_(std::move(process_name)),
    positional_specs_(build_positional_specs(argv_spec)) {}

std::vector<CommandLineParser::ArgvSpec> CommandLineParser::build_positional_specs(const nlohmann::json& spec) {
  std::vector<ArgvSpec> result;
  for(const auto& entry : spec) {
    ArgvSpec out;
    out.index = entry.at("index").get<std::size_t>();
    out.key = entry.at("key").get<std::string>();
    result.push_back(std::move(out));
  }
  std::sort(result.begin(), result.end(),
            [](const ArgvSpec& a, const ArgvSpec& b){ return a.index < b.index; });
  return result;
}

bool CommandLineParser::is_option_token(const std::string& candidate) {
  if(candidate.rfind("--", 0) == 0) return true;
  return candidate.size() >= 2 && candidate[0] == '-' &&
         std::isalpha(static_cast<unsigned char>(candidate[1]));
}

bool CommandLineParser::parse(int argc, char* argv[], SettingsManager& settings) const {
  for(const auto& argv_entry : positional_specs_) {
    if(!settings.resolve_key(argv_entry.key)) {
      print_err(nullptr, "ARGV specification references unknown setting '{}'", argv_entry.key);
      return false;
    }
  }

  std::vector<std::string> args;
  if(argc > 1 && argv) {
    args.assign(argv + 1, argv + argc);
  }
  std::size_t positional_index = 0;

  auto fail = [&](const std::string& message){
    print_err(nullptr, "{}", message);
    usage(settings);
    return false;
  };

  for(std::size_t i = 0; i < args.size(); ++i) {
    const std::string& token = args[i];

    // 1 = handled, 0 = not an option, -1 = error
    auto handle_option = [&](const std::string& key_token, bool long_form) -> int {
      auto resolved = settings.resolve_key(key_token);
      if(!resolved) {
        if(long_form) {
          fail("Unknown option --" + key_token);
          return -1;
        }
        return 0;
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
          fail("Missing value for option '" + key_token + "'");
          return -1;
        }
        value = args[++i];
      }
      std::string error;
      if(!settings.set_from_string(*resolved, value, error)) {
        fail("Invalid value for option '" + key_token + "': " + error);
        return -1;
      }
      return 1;
    };

    if(token.rfind("--", 0) == 0) {
      if(handle_option(token.substr(2), true) < 0) return false;
      continue;
    }

    if(token.size() > 1 && token[0] == '-' && token[1] != '-') {
      int handled = handle_option(token.substr(1), false);
      if(handled < 0) return false;
      if(handled > 0) continue;
      // unrecognised alias is taken as a positional value
    }

    if(positional_index >= positional_specs_.size()) {
      return fail("Unexpected positional argument '" + token + "'");
    }
    const auto& spec = positional_specs_[positional_index++];
    std::string error;
    if(!settings.set_from_string(spec.key, token, error)) {
      return fail("Invalid value for " + spec.key + " '" + token + "': " + error);
    }
  }
  return true;
}

void CommandLineParser::usage(const SettingsManager& settings) const {
  print_out(nullptr, "{} - coordinated access to a synchronized document container", process_name_);
  print_out(nullptr, "Usage:");
  print_out(nullptr, "  {} <command> [arg1] [arg2] [--options]", process_name_);
  print_out(nullptr, "");
  print_out(nullptr, "Commands:");
  for(const auto& entry : kCommandHelp) {
    print_out(nullptr, "  {:<28} {}", entry[0], entry[1]);
  }
  print_out(nullptr, "");
  print_out(nullptr, "Options:");
  for(const auto& key : settings.keys()) {
    if(std::any_of(positional_specs_.begin(), positional_specs_.end(),
                   [&](const ArgvSpec& spec){ return spec.key == key; })) {
      continue;
    }
    auto type = settings.type_of(key);
    std::string argument_hint = (type == "bool") ? "[true|false]" : "<" + type + ">";
    std::ostringstream aliases;
    const auto alias_list = settings.aliases_of(key);
    if(!alias_list.empty()) {
      aliases << " (alias: ";
      for(std::size_t i = 0; i < alias_list.size(); ++i) {
        if(i > 0) aliases << ", ";
        aliases << "-" << alias_list[i];
      }
      aliases << ")";
    }
    print_out(nullptr, "  --{} {:<12} {}{} (default: {})",
              key,
              argument_hint,
              settings.description_of(key),
              aliases.str(),
              settings.default_as_string(key));
  }
  print_out(nullptr, "");
}

} // namespace docsync
