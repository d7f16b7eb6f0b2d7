#pragma once

#include <string>

namespace berth::config {

struct GithubConfig {
  std::string token;
  std::string owner;
  std::string api_url = "https://api.github.com";
};

struct PortsConfig {
  int range_start = 3000;
  int range_end = 4000;
};

struct DatabaseConfig {
  std::string host = "127.0.0.1";
  int port = 5432;
  std::string admin_user = "postgres";
  std::string admin_password_file;
  std::string admin_database = "postgres";
  // Read from admin_password_file at load time, never written back.
  std::string admin_password;
};

struct NginxConfig {
  std::string sites_dir = "/etc/nginx/sites-available";
  std::string enabled_dir = "/etc/nginx/sites-enabled";
};

struct ReleasesConfig {
  std::string asset_pattern = "{name}-linux-amd64";
};

struct PathsConfig {
  std::string bin_dir = "/opt/berth/bin";
  std::string config_dir = "/etc/berth";
  std::string state_db = "/var/lib/berth/state.db";
  std::string unit_dir = "/etc/systemd/system";
  std::string lock_dir = "/var/lib/berth/locks";
};

struct HealthConfig {
  int timeout_secs = 10;
  int start_timeout_secs = 10;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  GithubConfig github;
  PortsConfig ports;
  DatabaseConfig database;
  NginxConfig nginx;
  ReleasesConfig releases;
  PathsConfig paths;
  HealthConfig health;
  ObservabilityConfig observability;
};

} // namespace berth::config
