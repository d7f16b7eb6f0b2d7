#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "berth/cli/commands.hpp"
#include "berth/config/config.hpp"
#include "berth/observability/global.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace {

int run(std::vector<std::string> args) {
  args.insert(args.begin(), "berth");
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }
  const int code = berth::cli::run_cli(static_cast<int>(argv.size()), argv.data());
  berth::config::clear_config_path_override();
  berth::observability::set_global_observer(nullptr);
  return code;
}

/// Config whose paths all live under the temp dir, so read-only commands can run.
std::string write_sandbox_config(const berth::testing::TempDir &dir) {
  const auto root = dir.path().string();
  dir.create_file("db-admin-password", "s3cret\n");
  dir.create_file("berth.toml", "[github]\n"
                                "token = \"t\"\n"
                                "owner = \"acme\"\n\n"
                                "[database]\n"
                                "admin_password_file = \"" +
                                    root + "/db-admin-password\"\n\n"
                                           "[paths]\n"
                                           "bin_dir = \"" +
                                    root + "/bin\"\n"
                                           "config_dir = \"" +
                                    root + "/etc\"\n"
                                           "state_db = \"" +
                                    root + "/state.db\"\n"
                                           "unit_dir = \"" +
                                    root + "/units\"\n"
                                           "lock_dir = \"" +
                                    root + "/locks\"\n");
  return (dir.path() / "berth.toml").string();
}

} // namespace

void register_cli_tests(std::vector<berth::tests::TestCase> &tests) {
  using berth::tests::require;
  namespace cli = berth::cli;

  tests.push_back({"cli_version_string_names_binary", [] {
                     require(cli::version_string().rfind("berth ", 0) == 0, "prefix");
                     require(cli::version_string().size() > std::string("berth ").size(),
                             "has a version");
                   }});

  tests.push_back({"cli_sensitive_keys", [] {
                     require(cli::is_sensitive_key("DB_PASSWORD"), "password");
                     require(cli::is_sensitive_key("github_token"), "token lowercase");
                     require(cli::is_sensitive_key(" API_KEY "), "key trimmed");
                     require(cli::is_sensitive_key("CLIENT_SECRET"), "secret");
                     require(!cli::is_sensitive_key("PORT"), "port");
                     require(!cli::is_sensitive_key("DB_HOST"), "host");
                   }});

  tests.push_back({"cli_mask_secrets_in_env_and_toml", [] {
                     const std::string env = "PORT=3000\nDB_PASSWORD=hunter2\n# TOKEN=x\n";
                     require(cli::mask_secrets(env) ==
                                 "PORT=3000\nDB_PASSWORD=********\n# TOKEN=x\n",
                             "env masked, comment kept");
                     const std::string toml = "DB_HOST = \"127.0.0.1\"\nAPI_KEY = \"abc\"\n";
                     require(cli::mask_secrets(toml) ==
                                 "DB_HOST = \"127.0.0.1\"\nAPI_KEY = \"********\"\n",
                             "toml masked");
                   }});

  tests.push_back({"cli_help_version_and_unknown_command", [] {
                     require(run({}) == 0, "bare invocation prints help");
                     require(run({"help"}) == 0, "help");
                     require(run({"--version"}) == 0, "version");
                     require(run({"frobnicate"}) == 1, "unknown command");
                     require(run({"--config"}) == 1, "missing --config value");
                     require(run({"--config="}) == 1, "empty --config value");
                   }});

  tests.push_back({"cli_usage_errors_exit_nonzero", [] {
                     berth::testing::TempDir dir;
                     const auto config = write_sandbox_config(dir);
                     require(run({"--config", config, "status"}) == 1, "status needs a name");
                     require(run({"--config", config, "inspect", "a", "b"}) == 1,
                             "inspect takes one name");
                     require(run({"--config", config, "init", "--bogus"}) == 1,
                             "unknown option");
                   }});

  tests.push_back({"cli_read_only_commands_against_sandbox_config", [] {
                     berth::testing::TempDir dir;
                     const auto config = write_sandbox_config(dir);
                     require(run({"--config", config, "list"}) == 0, "empty list");
                     require(std::filesystem::exists(dir.path() / "state.db"),
                             "state store created");
                     require(run({"--config=" + config, "inspect", "ghost"}) == 1,
                             "unknown service");
                     require(run({"--config", config, "config-path"}) == 0, "config-path");
                   }});

  tests.push_back({"cli_missing_config_fails", [] {
                     berth::testing::TempDir dir;
                     const auto missing = (dir.path() / "absent.toml").string();
                     require(run({"--config", missing, "list"}) == 1, "config required");
                   }});
}
