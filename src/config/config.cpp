#include "berth/config/config.hpp"

#include "berth/common/fs.hpp"
#include "berth/common/toml.hpp"

#include <cstdlib>

namespace berth::config {

namespace {

constexpr const char *DEFAULT_CONFIG_PATH = "/etc/berth/berth.toml";
constexpr const char *CONFIG_ENV = "BERTH_CONFIG";
constexpr int MAX_PORT = 65535;
constexpr int WIDE_RANGE = 10'000;

std::optional<std::filesystem::path> g_config_path_override;

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string env_value(const char *name) {
  if (const char *value = std::getenv(name); value != nullptr && *value != '\0') {
    return value;
  }
  return "";
}

void load_paths(Config &config, const common::TomlDocument &doc) {
  auto &paths = config.paths;
  paths.bin_dir = expand_config_value(doc.get_string("paths.bin_dir", paths.bin_dir));
  paths.config_dir = expand_config_value(doc.get_string("paths.config_dir", paths.config_dir));
  paths.state_db = expand_config_value(doc.get_string("paths.state_db", paths.state_db));
  paths.unit_dir = expand_config_value(doc.get_string("paths.unit_dir", paths.unit_dir));
  paths.lock_dir = expand_config_value(doc.get_string("paths.lock_dir", paths.lock_dir));
}

common::Status resolve_admin_password(DatabaseConfig &database) {
  if (database.admin_password_file.empty()) {
    return common::Status::success();
  }
  auto content = common::read_file(database.admin_password_file);
  if (!content.ok()) {
    return common::Status::error("reading database admin password: " + content.error());
  }
  database.admin_password = common::trim(content.value());
  return common::Status::success();
}

} // namespace

std::filesystem::path config_path() {
  if (g_config_path_override.has_value()) {
    return *g_config_path_override;
  }
  if (const std::string env = env_value(CONFIG_ENV); !env.empty()) {
    return std::filesystem::path(common::expand_path(env));
  }
  return DEFAULT_CONFIG_PATH;
}

bool config_exists() {
  std::error_code ec;
  return std::filesystem::exists(config_path(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (const std::string token = env_value("BERTH_GITHUB_TOKEN"); !token.empty()) {
    config.github.token = token;
  }
  if (const std::string owner = env_value("BERTH_GITHUB_OWNER"); !owner.empty()) {
    config.github.owner = owner;
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  Config config;
  config.github.token = expand_config_value(doc.get_string("github.token"));
  config.github.owner = doc.get_string("github.owner");
  config.github.api_url = doc.get_string("github.api_url", config.github.api_url);

  config.ports.range_start = doc.get_int("ports.range_start", config.ports.range_start);
  config.ports.range_end = doc.get_int("ports.range_end", config.ports.range_end);

  auto &database = config.database;
  database.host = doc.get_string("database.host", database.host);
  database.port = doc.get_int("database.port", database.port);
  database.admin_user = doc.get_string("database.admin_user", database.admin_user);
  database.admin_password_file =
      expand_config_value(doc.get_string("database.admin_password_file"));
  database.admin_database = doc.get_string("database.admin_database", database.admin_database);

  config.nginx.sites_dir =
      expand_config_value(doc.get_string("nginx.sites_dir", config.nginx.sites_dir));
  config.nginx.enabled_dir =
      expand_config_value(doc.get_string("nginx.enabled_dir", config.nginx.enabled_dir));

  config.releases.asset_pattern =
      doc.get_string("releases.asset_pattern", config.releases.asset_pattern);

  load_paths(config, doc);

  config.health.timeout_secs = doc.get_int("health.timeout_secs", config.health.timeout_secs);
  config.health.start_timeout_secs =
      doc.get_int("health.start_timeout_secs", config.health.start_timeout_secs);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config_from(const std::filesystem::path &path) {
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("reading config " + path.string() + ": " +
                                           content.error());
  }

  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure("parsing config " + path.string() + ": " +
                                           parsed.error());
  }

  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  if (auto status = resolve_admin_password(config.database); !status.ok()) {
    return common::Result<Config>::failure(status.error());
  }
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() { return load_config_from(config_path()); }

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (common::trim(config.github.token).empty()) {
    return ValidationResult::failure("github.token is required");
  }
  if (common::trim(config.github.owner).empty()) {
    return ValidationResult::failure("github.owner is required");
  }

  const auto &ports = config.ports;
  if (ports.range_start <= 0 || ports.range_end > MAX_PORT + 1) {
    return ValidationResult::failure("ports range must lie within 1-65535");
  }
  if (ports.range_start >= ports.range_end) {
    return ValidationResult::failure("ports.range_start (" + std::to_string(ports.range_start) +
                                     ") must be less than ports.range_end (" +
                                     std::to_string(ports.range_end) + ")");
  }
  if (ports.range_end - ports.range_start > WIDE_RANGE) {
    warnings.push_back("ports range spans more than " + std::to_string(WIDE_RANGE) + " ports");
  }
  if (ports.range_start < 1024) {
    warnings.push_back("ports.range_start is below 1024; services need extra privileges to bind");
  }

  if (config.database.admin_password_file.empty()) {
    return ValidationResult::failure("database.admin_password_file is required");
  }
  if (config.database.port <= 0 || config.database.port > MAX_PORT) {
    return ValidationResult::failure("database.port is out of range");
  }

  if (config.releases.asset_pattern.find("{name}") == std::string::npos &&
      config.releases.asset_pattern.find("{version}") == std::string::npos) {
    warnings.push_back("releases.asset_pattern has no {name} or {version} placeholder");
  }

  if (config.health.timeout_secs <= 0 || config.health.start_timeout_secs <= 0) {
    return ValidationResult::failure("health timeouts must be positive");
  }

  const std::string backend = common::to_lower(config.observability.backend);
  if (backend != "log" && backend != "none" && backend != "noop") {
    warnings.push_back("unknown observability.backend '" + config.observability.backend +
                       "', using log");
  }

  return ValidationResult::success(std::move(warnings));
}

std::string template_config() {
  const Config defaults;
  std::string out;
  out += "# berth configuration\n\n";
  out += "[github]\n";
  out += "# Token with read access to release assets. ${VAR} references are expanded.\n";
  out += "token = \"\"\n";
  out += "# Owner used when a repository is given without one.\n";
  out += "owner = \"\"\n\n";
  out += "[ports]\n";
  out += "range_start = " + std::to_string(defaults.ports.range_start) + "\n";
  out += "range_end = " + std::to_string(defaults.ports.range_end) + "\n\n";
  out += "[database]\n";
  out += "host = " + common::quote_toml_string(defaults.database.host) + "\n";
  out += "port = " + std::to_string(defaults.database.port) + "\n";
  out += "admin_user = " + common::quote_toml_string(defaults.database.admin_user) + "\n";
  out += "admin_password_file = \"/etc/berth/db-admin-password\"\n\n";
  out += "[nginx]\n";
  out += "sites_dir = " + common::quote_toml_string(defaults.nginx.sites_dir) + "\n";
  out += "enabled_dir = " + common::quote_toml_string(defaults.nginx.enabled_dir) + "\n\n";
  out += "[releases]\n";
  out += "# Placeholders: {name}, {version}\n";
  out += "asset_pattern = " + common::quote_toml_string(defaults.releases.asset_pattern) + "\n\n";
  out += "[health]\n";
  out += "timeout_secs = " + std::to_string(defaults.health.timeout_secs) + "\n";
  out += "start_timeout_secs = " + std::to_string(defaults.health.start_timeout_secs) + "\n\n";
  out += "[observability]\n";
  out += "backend = " + common::quote_toml_string(defaults.observability.backend) + "\n";
  return out;
}

} // namespace berth::config
