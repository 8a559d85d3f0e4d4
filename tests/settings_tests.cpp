#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "sync_coordinator.hpp"
#include "test_runner_utils.hpp"

using namespace std::chrono_literals;

namespace docsync::test {

namespace {

// Owns the argv storage handed to CommandLineParser::parse.
class Argv {
public:
  Argv(std::initializer_list<std::string> args) : storage_(args) {
    for(auto& arg : storage_) pointers_.push_back(arg.data());
    pointers_.push_back(nullptr);
  }

  int argc() const { return static_cast<int>(storage_.size()); }
  char** argv() { return pointers_.data(); }

private:
  std::vector<std::string> storage_;
  std::vector<char*> pointers_;
};

bool test_default_options(TestContext&) {
  SettingsManager settings;
  CoordinatorOptions options;
  std::string error;
  bool ok = expect(coordinator_options_from_settings(settings, options, error), "defaults are valid: " + error);
  ok &= expect(options.read_schedule.idle == std::vector<std::chrono::milliseconds>({60s, 90s, 180s}), "read idle");
  ok &= expect(options.read_schedule.backoff == std::vector<std::chrono::milliseconds>({2s, 4s}), "read backoff");
  ok &= expect(options.download_schedule.attempt_count() == 3, "three download attempts");
  ok &= expect(options.lookup.timeout == 30s && options.lookup.warning == 10s, "lookup timing");
  ok &= expect(options.copy_buffer_size == 64 * 1024, "copy buffer");
  return ok;
}

bool test_invalid_values_rejected(TestContext&) {
  std::string error;
  SettingsManager settings;
  bool ok = expect(!settings.set_from_string("idle", "5,soon", error), "bad schedule rejected");
  ok &= expect(error.find("soon") != std::string::npos, "error names the entry: " + error);
  ok &= expect(!settings.set_from_string("dbackoff", "1,-2", error), "negative backoff rejected");
  ok &= expect(!settings.set_from_json("idle_schedule", "", error), "empty schedule rejected");
  ok &= expect(!settings.set_from_string("qt", "0", error), "zero timeout rejected");
  ok &= expect(error.find("at least 1") != std::string::npos, "bound reported: " + error);
  ok &= expect(!settings.set_from_string("qt", "soon", error), "int setting rejects text");
  ok &= expect(!settings.set_from_json("store_root", 5, error), "path must be a string");
  ok &= expect(!settings.set_from_string("no_such_key", "1", error) && error == "unknown setting", "unknown key");

  CoordinatorOptions options;
  ok &= expect(coordinator_options_from_settings(settings, options, error), "rejected values left defaults intact");
  ok &= expect(options.lookup.timeout == 30s, "timeout unchanged");

  ok &= expect(settings.set_from_string("idle", "0.5, 1.5", error), "fractional seconds accepted");
  ok &= expect(coordinator_options_from_settings(settings, options, error), "options rebuilt");
  ok &= expect(options.read_schedule.idle == std::vector<std::chrono::milliseconds>({500ms, 1500ms}),
               "fractional schedule");
  return ok;
}

bool test_invalid_file_values_ignored(TestContext&) {
  TempWorkspace workspace("settings_file");
  auto path = workspace.write_file("docsync.json",
    R"({"container": "photos", "query_timeout_s": -4, "idle_schedule": "x", "command": "delete"})");
  SettingsManager settings;
  settings.set_settings_path(path);
  bool ok = expect(settings.load(), "file read");
  ok &= expect(settings.get<std::string>("container") == "photos", "valid value applied");
  ok &= expect(settings.get<int>("query_timeout_s") == 30, "out of range value ignored");
  ok &= expect(settings.get<std::string>("idle_schedule") == "60,90,180", "bad schedule ignored");
  ok &= expect(settings.get<std::string>("command").empty(), "per-invocation keys are not loaded");
  return ok;
}

bool test_command_line_positional_and_options(TestContext&) {
  SettingsManager settings;
  CommandLineParser parser("docsync");
  Argv args{"docsync", "download", "a.txt", "out.txt", "--idle", "5,5,5", "-v", "--container", "photos"};
  bool ok = expect(parser.parse(args.argc(), args.argv(), settings), "parses");
  ok &= expect(settings.get<std::string>("command") == "download", "command");
  ok &= expect(settings.get<std::string>("arg1") == "a.txt" && settings.get<std::string>("arg2") == "out.txt",
               "positional arguments");
  ok &= expect(settings.get<std::string>("idle_schedule") == "5,5,5", "option through its alias");
  ok &= expect(settings.get<bool>("verbose"), "bare bool flag");
  ok &= expect(settings.get<std::string>("container") == "photos", "container");

  Argv flags{"docsync", "list", "-w", "false", "--am", "off"};
  SettingsManager other;
  ok &= expect(parser.parse(flags.argc(), flags.argv(), other), "bool literals parse");
  ok &= expect(!other.get<bool>("watch") && !other.get<bool>("auto_materialize"), "explicit false values");
  return ok;
}

bool test_command_line_rejects_bad_input(TestContext&) {
  CommandLineParser parser("docsync");
  SettingsManager settings;
  Argv unknown{"docsync", "list", "--frobnicate"};
  bool ok = expect(!parser.parse(unknown.argc(), unknown.argv(), settings), "unknown long option");

  Argv missing{"docsync", "list", "--container"};
  ok &= expect(!parser.parse(missing.argc(), missing.argv(), settings), "missing option value");

  Argv extra{"docsync", "move", "a", "b", "c"};
  ok &= expect(!parser.parse(extra.argc(), extra.argv(), settings), "too many positionals");
  return ok;
}

bool test_persists_only_persistent_settings(TestContext&) {
  TempWorkspace workspace("settings_persist");
  auto path = workspace.root() / ".config" / "docsync.json";
  std::string error;

  SettingsManager settings;
  settings.set_settings_path(path);
  settings.set_from_string("container", "photos", error);
  settings.set_from_string("watch", "true", error);
  settings.set_from_string("command", "list", error);
  bool ok = expect(settings.save(), "saved");

  SettingsManager reloaded;
  reloaded.set_settings_path(path);
  ok &= expect(reloaded.load(), "loaded");
  ok &= expect(reloaded.get<std::string>("container") == "photos", "persistent value restored");
  ok &= expect(!reloaded.get<bool>("watch"), "watch is per invocation");
  ok &= expect(reloaded.get<std::string>("command").empty(), "command is per invocation");

  auto store_root = reloaded.get_path("store_root", workspace.root());
  ok &= expect(store_root == workspace.root() / "store", "relative store root resolved against the base");
  return ok;
}

} // namespace

std::vector<TestCase> settings_tests() {
  return {
    {"settings_default_options", test_default_options},
    {"settings_invalid_values_rejected", test_invalid_values_rejected},
    {"settings_invalid_file_values_ignored", test_invalid_file_values_ignored},
    {"settings_command_line_positional_and_options", test_command_line_positional_and_options},
    {"settings_command_line_rejects_bad_input", test_command_line_rejects_bad_input},
    {"settings_persists_only_persistent_settings", test_persists_only_persistent_settings},
  };
}

} // namespace docsync::test
