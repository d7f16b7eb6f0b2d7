#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "berth/config/config.hpp"

#include <cstdlib>
#include <filesystem>
#include <optional>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    if (next.has_value()) {
      berth::config::set_config_path_override(*next);
    } else {
      berth::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() { berth::config::clear_config_path_override(); }
};

const char *MINIMAL_CONFIG = "[github]\n"
                             "token = \"ghp_example\"\n"
                             "owner = \"acme\"\n"
                             "[database]\n"
                             "admin_password_file = \"ADMIN_FILE\"\n";

std::string minimal_config(const std::filesystem::path &admin_file) {
  std::string content = MINIMAL_CONFIG;
  content.replace(content.find("ADMIN_FILE"), 10, admin_file.string());
  return content;
}

} // namespace

void register_config_tests(std::vector<berth::tests::TestCase> &tests) {
  using berth::tests::require;
  namespace cfg = berth::config;

  tests.push_back({"config_path_prefers_override_then_env", [] {
                     EnvGuard env("BERTH_CONFIG", "/tmp/berth-from-env.toml");
                     {
                       ConfigOverrideGuard guard;
                       require(cfg::config_path().string() == "/tmp/berth-from-env.toml", "env path");
                     }
                     {
                       ConfigOverrideGuard guard(std::filesystem::path("/tmp/override.toml"));
                       require(cfg::config_path().string() == "/tmp/override.toml", "override wins");
                     }
                     EnvGuard unset("BERTH_CONFIG", std::nullopt);
                     ConfigOverrideGuard guard;
                     require(cfg::config_path().string() == "/etc/berth/berth.toml", "default path");
                   }});

  tests.push_back({"config_defaults_fill_missing_sections", [] {
                     auto parsed = cfg::parse_config("[github]\ntoken = \"t\"\nowner = \"o\"\n");
                     require(parsed.ok(), "parses");
                     const auto &config = parsed.value();
                     require(config.ports.range_start == 3000, "default range start");
                     require(config.ports.range_end == 4000, "default range end");
                     require(config.database.port == 5432, "default database port");
                     require(config.database.admin_user == "postgres", "default admin user");
                     require(config.nginx.sites_dir == "/etc/nginx/sites-available", "sites dir");
                     require(config.releases.asset_pattern == "{name}-linux-amd64", "pattern");
                     require(config.paths.bin_dir == "/opt/berth/bin", "bin dir");
                     require(config.health.timeout_secs == 10, "health timeout");
                   }});

  tests.push_back({"config_parses_every_section", [] {
                     auto parsed = cfg::parse_config("[ports]\n"
                                                     "range_start = 5000\n"
                                                     "range_end = 5100\n"
                                                     "[database]\n"
                                                     "host = \"db.internal\"\n"
                                                     "port = 6432\n"
                                                     "[nginx]\n"
                                                     "sites_dir = \"/srv/sites\"\n"
                                                     "[releases]\n"
                                                     "asset_pattern = \"{name}_{version}\"\n"
                                                     "[paths]\n"
                                                     "bin_dir = \"/srv/bin\"\n"
                                                     "[observability]\n"
                                                     "backend = \"none\"\n");
                     require(parsed.ok(), "parses");
                     const auto &config = parsed.value();
                     require(config.ports.range_start == 5000, "range start");
                     require(config.ports.range_end == 5100, "range end");
                     require(config.database.host == "db.internal", "db host");
                     require(config.database.port == 6432, "db port");
                     require(config.nginx.sites_dir == "/srv/sites", "sites dir");
                     require(config.releases.asset_pattern == "{name}_{version}", "pattern");
                     require(config.paths.bin_dir == "/srv/bin", "bin dir");
                     require(config.observability.backend == "none", "backend");
                   }});

  tests.push_back({"config_token_expands_environment_reference", [] {
                     EnvGuard token("BERTH_TEST_TOKEN", "from-env");
                     auto parsed = cfg::parse_config(
                         "[github]\ntoken = \"${BERTH_TEST_TOKEN}\"\nowner = \"acme\"\n");
                     require(parsed.ok(), "parses");
                     require(parsed.value().github.token == "from-env", "expanded");
                   }});

  tests.push_back({"config_load_reads_admin_password_and_env_overrides", [] {
                     berth::testing::TempDir dir;
                     dir.create_file("admin", "s3cret\n");
                     dir.create_file("berth.toml", minimal_config(dir.path() / "admin"));
                     EnvGuard owner("BERTH_GITHUB_OWNER", "override-owner");
                     EnvGuard token("BERTH_GITHUB_TOKEN", std::nullopt);
                     ConfigOverrideGuard guard(dir.path() / "berth.toml");

                     auto loaded = cfg::load_config();
                     require(loaded.ok(), "loads");
                     require(loaded.value().database.admin_password == "s3cret",
                             "password read and trimmed");
                     require(loaded.value().github.owner == "override-owner", "env override");
                     require(loaded.value().github.token == "ghp_example", "file token kept");
                   }});

  tests.push_back({"config_load_fails_without_admin_password_file", [] {
                     berth::testing::TempDir dir;
                     dir.create_file("berth.toml", minimal_config(dir.path() / "missing"));
                     auto loaded = cfg::load_config_from(dir.path() / "berth.toml");
                     require(!loaded.ok(), "load fails");
                     require(loaded.error().find("admin password") != std::string::npos,
                             "names the password file");
                   }});

  tests.push_back({"config_load_reports_missing_and_malformed_files", [] {
                     berth::testing::TempDir dir;
                     auto missing = cfg::load_config_from(dir.path() / "nope.toml");
                     require(!missing.ok(), "missing file");
                     dir.create_file("bad.toml", "[github]\ntoken\n");
                     auto malformed = cfg::load_config_from(dir.path() / "bad.toml");
                     require(!malformed.ok(), "malformed file");
                     require(malformed.error().find("parsing config") != std::string::npos,
                             "parse error context");
                   }});

  tests.push_back({"config_validate_requires_credentials_and_sane_ports", [] {
                     auto config = berth::testing::mock_config();
                     auto ok = cfg::validate_config(config);
                     require(ok.ok() && ok.value().empty(), "mock config is clean");

                     auto no_token = config;
                     no_token.github.token.clear();
                     require(!cfg::validate_config(no_token).ok(), "token required");

                     auto inverted = config;
                     inverted.ports.range_start = 4000;
                     inverted.ports.range_end = 3000;
                     auto inverted_result = cfg::validate_config(inverted);
                     require(!inverted_result.ok(), "inverted range rejected");
                     require(inverted_result.error().find("range_start") != std::string::npos,
                             "message names the field");

                     auto low = config;
                     low.ports.range_start = 80;
                     auto low_result = cfg::validate_config(low);
                     require(low_result.ok() && low_result.value().size() == 1,
                             "privileged range warns");

                     auto no_password = config;
                     no_password.database.admin_password_file.clear();
                     require(!cfg::validate_config(no_password).ok(), "password file required");
                   }});

  tests.push_back({"config_template_parses_to_defaults", [] {
                     const std::string text = cfg::template_config();
                     auto parsed = cfg::parse_config(text);
                     require(parsed.ok(), "template parses");
                     require(parsed.value().ports.range_start == 3000, "default range");
                     require(parsed.value().database.admin_password_file ==
                                 "/etc/berth/db-admin-password",
                             "password file placeholder");
                     require(text.find("[paths]") == std::string::npos, "no paths section");
                   }});
}
