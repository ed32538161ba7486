#include "command_line_parser.hpp"
#include "settings_manager.hpp"
#include "test_runner_utils.hpp"
#include "woxxy_engine.hpp"

#include <string>
#include <vector>

using woxxy::test::TestCase;
using woxxy::test::TestContext;

namespace {

bool parse(const std::vector<std::string>& args, SettingsManager& settings, std::string& error) {
  CommandLineParser parser;
  return parser.try_parse(args, settings, error);
}

bool test_defaults(TestContext&) {
  SettingsManager settings;
  return settings.get<std::string>("username") == "WoxxyUser" &&
         settings.get<int>("transfer_port") == 8090 &&
         settings.get<int>("discovery_port") == 8091 &&
         settings.get<int>("peer_timeout_s") == 30 &&
         settings.get<int>("connect_timeout_ms") == 10000 &&
         settings.get<bool>("checksum_enabled") &&
         settings.value_as_string("broadcast_address") == "255.255.255.255" &&
         !settings.help_requested();
}

bool test_long_options_and_aliases(TestContext&) {
  SettingsManager settings;
  std::string error;
  bool ok = parse({"--username", "alice", "-tp", "9000", "--DP", "9001", "-md5", "off"}, settings, error);
  return ok && error.empty() &&
         settings.get<std::string>("username") == "alice" &&
         settings.get<int>("transfer_port") == 9000 &&
         settings.get<int>("discovery_port") == 9001 &&
         !settings.get<bool>("checksum_enabled");
}

bool test_bool_flag_without_value(TestContext&) {
  SettingsManager settings;
  std::string error;
  bool ok = parse({"-v", "--port", "7000"}, settings, error);
  return ok && settings.get<bool>("verbose") && settings.get<int>("transfer_port") == 7000;
}

bool test_positionals(TestContext&) {
  SettingsManager settings;
  std::string error;
  bool ok = parse({"carol", "/tmp/inbox"}, settings, error);
  bool too_many = !parse({"carol", "/tmp/inbox", "extra"}, settings, error) &&
                  error.find("extra") != std::string::npos;
  return ok && too_many &&
         settings.get<std::string>("username") == "carol" &&
         settings.get<std::string>("download_dir") == "/tmp/inbox";
}

bool test_bad_tokens(TestContext&) {
  SettingsManager settings;
  std::string unknown, missing, bad_int;
  bool a = !parse({"--nope", "1"}, settings, unknown);
  bool b = !parse({"--username"}, settings, missing);
  bool c = !parse({"--transfer_port", "lots"}, settings, bad_int);
  return a && b && c &&
         unknown == "Unknown option --nope" &&
         missing.find("Missing value") != std::string::npos &&
         bad_int.find("Invalid value") != std::string::npos &&
         settings.get<int>("transfer_port") == 8090;
}

bool test_set_from_string(TestContext&) {
  SettingsManager settings;
  std::string error;
  bool bool_ok = settings.set_from_string("checksum", " no ", error) && !settings.get<bool>("checksum_enabled");
  bool bad_bool = !settings.set_from_string("checksum", "maybe", error) && !error.empty();
  bool unknown = !settings.set_from_string("colour", "blue", error) && error == "unknown setting";
  bool name_ok = settings.set_from_string("u", "  dave  ", error) && settings.get<std::string>("username") == "dave";
  return bool_ok && bad_bool && unknown && name_ok;
}

bool test_integer_limits(TestContext&) {
  SettingsManager settings;
  std::string error;
  bool port_rejected = !settings.set_from_string("transfer_port", "70000", error) &&
                       error.find("outside") != std::string::npos;
  bool chunk_rejected = !settings.set_from_json("chunk_size", 16, error);
  bool trailing_rejected = !settings.set_from_string("dp", "80x", error);
  bool zero_port_ok = settings.set_from_string("transfer_port", "0", error);
  return port_rejected && chunk_rejected && trailing_rejected && zero_port_ok &&
         settings.get<int>("transfer_port") == 0 &&
         settings.get<int>("chunk_size") == 65536 &&
         settings.get<int>("discovery_port") == 8091;
}

bool test_load_from_file(TestContext&) {
  auto dir = woxxy::test::scratch_dir("settings_load");
  auto path = dir / "settings.json";
  woxxy::test::write_file(path, R"({"username":"erin","transfer_port":9100,"checksum_enabled":0,"mystery":true,"discovery_port":"x"})");
  SettingsManager settings;
  settings.set_settings_path(path);
  bool loaded = settings.load();
  bool ok = loaded && settings.settings_path() == path &&
            settings.get<std::string>("username") == "erin" &&
            settings.get<int>("transfer_port") == 9100 &&
            !settings.get<bool>("checksum_enabled") &&
            settings.get<int>("discovery_port") == 8091;

  woxxy::test::write_file(path, "{ not json");
  SettingsManager broken;
  bool rejected = !broken.load_from_file(path) && !broken.load_from_file(dir / "absent.json");

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
  return ok && rejected;
}

bool test_persistent_json_skips_transient_keys(TestContext&) {
  SettingsManager settings;
  std::string error;
  settings.set_from_string("config", "/tmp/other.json", error);
  auto persistent = settings.get_json();
  auto everything = settings.get_json(false);
  return !persistent.contains("config") && !persistent.contains("help") &&
         persistent.contains("username") && everything.contains("config");
}

bool test_profile_from_settings(TestContext&) {
  SettingsManager settings;
  std::string error;
  settings.set_from_string("username", "frank", error);
  settings.set_from_string("download_dir", "/srv/inbox", error);
  settings.set_from_string("checksum_enabled", "false", error);
  auto profile = profile_from_settings(settings);

  SettingsManager defaults;
  auto fallback = profile_from_settings(defaults);
  return profile.username == "frank" && profile.download_directory == "/srv/inbox" &&
         !profile.checksum_enabled &&
         fallback.download_directory == SettingsManager::home_directory() / "Downloads";
}

} // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests = {
    {"defaults", test_defaults},
    {"long_options_and_aliases", test_long_options_and_aliases},
    {"bool_flag_without_value", test_bool_flag_without_value},
    {"positionals", test_positionals},
    {"bad_tokens", test_bad_tokens},
    {"set_from_string", test_set_from_string},
    {"integer_limits", test_integer_limits},
    {"load_from_file", test_load_from_file},
    {"persistent_json_skips_transient_keys", test_persistent_json_skips_transient_keys},
    {"profile_from_settings", test_profile_from_settings}
  };
  return woxxy::test::run_tests("settings", tests, argc, argv);
}
