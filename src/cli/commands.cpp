#include "berth/cli/commands.hpp"

#include "berth/artifact/store.hpp"
#include "berth/common/cancellation.hpp"
#include "berth/common/fs.hpp"
#include "berth/common/poll.hpp"
#include "berth/config/config.hpp"
#include "berth/creds/credentials.hpp"
#include "berth/database/manager.hpp"
#include "berth/doctor/diagnostics.hpp"
#include "berth/fetch/http_client.hpp"
#include "berth/fetch/release_fetcher.hpp"
#include "berth/health/port_check.hpp"
#include "berth/isolation/boundary.hpp"
#include "berth/lock/service_lock.hpp"
#include "berth/observability/factory.hpp"
#include "berth/observability/global.hpp"
#include "berth/orchestrator/orchestrator.hpp"
#include "berth/proxy/proxy.hpp"
#include "berth/runner/command_runner.hpp"
#include "berth/state/store.hpp"
#include "berth/supervisor/supervisor.hpp"

#include <chrono>
#include <csignal>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace berth::cli {

namespace {

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

/// Any option still left after a command took its own is a usage error.
bool reject_unknown_options(const std::vector<std::string> &args) {
  for (const auto &arg : args) {
    if (common::starts_with(arg, "-")) {
      std::cerr << "unknown option: " << arg << "\n";
      return false;
    }
  }
  return true;
}

common::CancellationToken &interrupt_token() {
  static common::CancellationToken token;
  return token;
}

void handle_interrupt(int) { interrupt_token().cancel(); }

void install_interrupt_handlers() {
  struct sigaction action {};
  action.sa_handler = handle_interrupt;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, nullptr);
  sigaction(SIGTERM, &action, nullptr);
}

std::string format_time(const std::int64_t unix_seconds) {
  const std::time_t raw = static_cast<std::time_t>(unix_seconds);
  std::tm tm_value{};
  gmtime_r(&raw, &tm_value);
  std::ostringstream out;
  out << std::put_time(&tm_value, "%Y-%m-%d %H:%M:%SZ");
  return out.str();
}

std::string describe_route(const state::Route &route) {
  if (route.empty()) {
    return "-";
  }
  return route.value + " (" + state::route_type_to_string(route.type) + ")";
}

/// Every collaborator wired from the loaded configuration.
struct Runtime {
  config::Config config;
  common::SystemClock clock;
  std::shared_ptr<runner::ICommandRunner> runner;
  std::shared_ptr<artifact::ArtifactStore> artifacts;
  std::shared_ptr<state::StateStore> store;
  std::shared_ptr<database::IDatabaseManager> database;
  std::unique_ptr<orchestrator::Orchestrator> orchestrator;
};

database::PostgresOptions postgres_options(const config::Config &config) {
  database::PostgresOptions options;
  options.host = config.database.host;
  options.port = config.database.port;
  options.admin_user = config.database.admin_user;
  options.admin_password = config.database.admin_password;
  options.admin_database = config.database.admin_database;
  return options;
}

common::Result<config::Config> load_checked_config(const bool require_valid) {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  if (require_valid) {
    auto validation = config::validate_config(cfg.value());
    if (!validation.ok()) {
      return common::Result<config::Config>::failure("invalid config " +
                                                     config::config_path().string() + ": " +
                                                     validation.error());
    }
    for (const auto &warning : validation.value()) {
      std::cerr << "warning: " << warning << "\n";
    }
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));
  return cfg;
}

common::Result<std::unique_ptr<Runtime>> build_runtime(const bool require_valid) {
  using RuntimeResult = common::Result<std::unique_ptr<Runtime>>;
  auto cfg = load_checked_config(require_valid);
  if (!cfg.ok()) {
    return RuntimeResult::failure(cfg.error());
  }

  auto runtime = std::make_unique<Runtime>();
  runtime->config = std::move(cfg.value());
  const auto &config = runtime->config;

  runtime->runner = std::make_shared<runner::SystemCommandRunner>();
  runtime->artifacts = std::make_shared<artifact::ArtifactStore>(config.paths.bin_dir);
  runtime->store = std::make_shared<state::StateStore>(config.paths.state_db);
  if (auto status = runtime->store->open(); !status.ok()) {
    return RuntimeResult::failure(status.error());
  }
  runtime->database = std::make_shared<database::PostgresDatabaseManager>(postgres_options(config));

  fetch::GithubFetcherOptions fetch_options;
  fetch_options.api_url = config.github.api_url;
  fetch_options.token = config.github.token;
  fetch_options.default_owner = config.github.owner;
  fetch_options.asset_pattern = config.releases.asset_pattern;

  supervisor::SystemdOptions systemd_options;
  systemd_options.unit_dir = config.paths.unit_dir;
  systemd_options.start_timeout = std::chrono::seconds(config.health.start_timeout_secs);

  proxy::NginxOptions nginx_options;
  nginx_options.sites_dir = config.nginx.sites_dir;
  nginx_options.enabled_dir = config.nginx.enabled_dir;

  orchestrator::Collaborators collaborators;
  collaborators.fetcher = std::make_shared<fetch::GithubReleaseFetcher>(
      fetch_options, std::make_shared<fetch::CurlHttpClient>(), *runtime->artifacts);
  collaborators.supervisor = std::make_shared<supervisor::SystemdSupervisor>(
      runtime->runner, systemd_options, runtime->clock);
  collaborators.proxy = std::make_shared<proxy::NginxProxyManager>(runtime->runner, nginx_options);
  collaborators.database = runtime->database;
  collaborators.credentials = std::make_shared<creds::FileCredentialWriter>();
  collaborators.health = std::make_shared<health::TcpHealthChecker>(runtime->clock);
  collaborators.artifacts = runtime->artifacts;
  collaborators.store = runtime->store;

  orchestrator::OrchestratorSettings settings;
  settings.config_dir = config.paths.config_dir;
  settings.port_range_start = config.ports.range_start;
  settings.port_range_end = config.ports.range_end;
  settings.health_timeout = std::chrono::seconds(config.health.timeout_secs);

  runtime->orchestrator =
      std::make_unique<orchestrator::Orchestrator>(std::move(collaborators), std::move(settings));
  return RuntimeResult::success(std::move(runtime));
}

int report_error(const orchestrator::WorkflowError &error) {
  std::cerr << "error: " << error.to_string() << "\n";
  return 1;
}

bool take_lock(lock::ServiceLock &service_lock) {
  if (auto status = service_lock.acquire(); !status.ok()) {
    std::cerr << "error: " << status.error() << "\n";
    return false;
  }
  return true;
}

int run_init(std::vector<std::string> args) {
  const bool force = take_flag(args, "--force");
  if (!reject_unknown_options(args)) {
    return 1;
  }

  const auto path = config::config_path();
  std::error_code ec;
  if (std::filesystem::exists(path, ec) && !force) {
    std::cout << "Config already exists: " << path.string() << "\n";
  } else {
    if (auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
      std::cerr << "error: " << dir.error() << "\n";
      return 1;
    }
    if (auto status = common::write_file_atomic(path, config::template_config(),
                                                 std::filesystem::perms::owner_read |
                                                     std::filesystem::perms::owner_write);
        !status.ok()) {
      std::cerr << "error: writing " << path.string() << ": " << status.error() << "\n";
      return 1;
    }
    std::cout << "Wrote " << path.string() << "\n";
  }

  const config::Config defaults;
  const std::vector<std::filesystem::path> dirs = {
      defaults.paths.bin_dir, defaults.paths.config_dir,
      std::filesystem::path(defaults.paths.state_db).parent_path(), defaults.paths.lock_dir};
  for (const auto &dir : dirs) {
    if (auto created = common::ensure_dir(dir); !created.ok()) {
      std::cerr << "error: " << created.error() << "\n";
      return 1;
    }
  }

  std::cout << "Next: set [github] token and owner, write the database admin password to "
               "the admin_password_file, then run 'berth doctor'.\n";
  return 0;
}

int run_deploy(std::vector<std::string> args) {
  orchestrator::DeployRequest request;
  std::string value;
  if (take_option(args, "--name", "-n", value)) {
    request.name = value;
  }
  if (take_option(args, "--version", "-v", value)) {
    request.version = value;
  }
  if (take_option(args, "--port", "-p", value)) {
    try {
      std::size_t consumed = 0;
      const int port = std::stoi(value, &consumed);
      if (consumed != value.size()) {
        throw std::invalid_argument(value);
      }
      request.port = port;
    } catch (const std::exception &) {
      std::cerr << "invalid --port value: " << value << "\n";
      return 1;
    }
  }
  if (take_option(args, "--route", "-r", value)) {
    request.route = value;
  }
  while (take_option(args, "--env", "-e", value)) {
    const auto eq = value.find('=');
    if (eq == std::string::npos || eq == 0) {
      std::cerr << "invalid --env value (expected KEY=VALUE): " << value << "\n";
      return 1;
    }
    request.extra_env[value.substr(0, eq)] = value.substr(eq + 1);
  }
  request.skip_database = take_flag(args, "--no-db");
  if (take_flag(args, "--config-file")) {
    request.secrets_format = creds::SecretsFormat::Toml;
  }
  if (!reject_unknown_options(args)) {
    return 1;
  }
  if (args.size() != 1) {
    std::cerr << "usage: berth deploy REPO [--name N] [--version V] [--port P] [--route R] "
                 "[--env K=V]... [--no-db] [--config-file]\n";
    return 1;
  }
  request.repo = args[0];
  if (request.name.empty()) {
    request.name = orchestrator::default_service_name(request.repo);
  }

  auto runtime = build_runtime(true);
  if (!runtime.ok()) {
    std::cerr << "error: " << runtime.error() << "\n";
    return 1;
  }
  if (auto status = isolation::validate_service_name(request.name); !status.ok()) {
    std::cerr << "error: " << status.error() << "\n";
    return 1;
  }
  lock::ServiceLock service_lock(runtime.value()->config.paths.lock_dir, request.name);
  if (!take_lock(service_lock)) {
    return 1;
  }

  request.cancel = interrupt_token();
  auto result = runtime.value()->orchestrator->deploy(request);
  if (!result.ok()) {
    return report_error(result.error());
  }

  const auto &deployed = result.value();
  const auto &service = deployed.service;
  std::cout << "Deployed " << service.name << " " << service.version << "\n";
  std::cout << "  port:     " << service.port << "\n";
  std::cout << "  route:    " << describe_route(service.route) << "\n";
  std::cout << "  database: " << (service.db_name.empty() ? "-" : service.db_name) << "\n";
  std::cout << "  secrets:  " << deployed.secrets_path.string() << "\n";
  std::cout << "  sha256:   " << deployed.artifact_sha256 << "\n";
  for (const auto &warning : deployed.warnings) {
    std::cerr << "warning: " << warning << "\n";
  }
  return 0;
}

int run_upgrade(std::vector<std::string> args) {
  orchestrator::UpgradeRequest request;
  std::string value;
  if (take_option(args, "--version", "-v", value)) {
    request.version = value;
  }
  if (!reject_unknown_options(args)) {
    return 1;
  }
  if (args.size() != 1) {
    std::cerr << "usage: berth upgrade NAME [--version V]\n";
    return 1;
  }
  request.name = args[0];

  auto runtime = build_runtime(true);
  if (!runtime.ok()) {
    std::cerr << "error: " << runtime.error() << "\n";
    return 1;
  }
  lock::ServiceLock service_lock(runtime.value()->config.paths.lock_dir, request.name);
  if (!take_lock(service_lock)) {
    return 1;
  }

  request.cancel = interrupt_token();
  auto result = runtime.value()->orchestrator->upgrade(request);
  if (!result.ok()) {
    return report_error(result.error());
  }

  const auto &upgraded = result.value();
  if (upgraded.no_change) {
    std::cout << upgraded.name << " is already at " << upgraded.from_version << "\n";
    return 0;
  }
  if (upgraded.rolled_back) {
    std::cerr << "Upgrade of " << upgraded.name << " was rolled back; still running "
              << upgraded.from_version << "\n";
    std::cerr << "  reason: " << upgraded.reason << "\n";
    return 1;
  }
  std::cout << "Upgraded " << upgraded.name << " " << upgraded.from_version << " -> "
            << upgraded.to_version << "\n";
  for (const auto &warning : upgraded.warnings) {
    std::cerr << "warning: " << warning << "\n";
  }
  return 0;
}

int run_rollback(std::vector<std::string> args) {
  if (!reject_unknown_options(args)) {
    return 1;
  }
  if (args.size() != 1) {
    std::cerr << "usage: berth rollback NAME\n";
    return 1;
  }
  orchestrator::RollbackRequest request;
  request.name = args[0];

  auto runtime = build_runtime(true);
  if (!runtime.ok()) {
    std::cerr << "error: " << runtime.error() << "\n";
    return 1;
  }
  lock::ServiceLock service_lock(runtime.value()->config.paths.lock_dir, request.name);
  if (!take_lock(service_lock)) {
    return 1;
  }

  request.cancel = interrupt_token();
  auto result = runtime.value()->orchestrator->rollback(request);
  if (!result.ok()) {
    return report_error(result.error());
  }
  std::cout << "Rolled back " << result.value().name << " " << result.value().from_version
            << " -> " << result.value().to_version << "\n";
  return 0;
}

bool confirm(const std::string &question) {
  std::cout << question << " [y/N]: " << std::flush;
  std::string answer;
  if (!std::getline(std::cin, answer)) {
    return false;
  }
  answer = common::to_lower(common::trim(answer));
  return answer == "y" || answer == "yes";
}

int run_remove(std::vector<std::string> args) {
  orchestrator::RemoveRequest request;
  request.drop_database = take_flag(args, "--drop-db");
  const bool assume_yes = take_flag(args, "--yes") || take_flag(args, "-y");
  if (!reject_unknown_options(args)) {
    return 1;
  }
  if (args.size() != 1) {
    std::cerr << "usage: berth remove NAME [--drop-db] [--yes]\n";
    return 1;
  }
  request.name = args[0];

  auto runtime = build_runtime(true);
  if (!runtime.ok()) {
    std::cerr << "error: " << runtime.error() << "\n";
    return 1;
  }
  if (request.drop_database && !assume_yes) {
    const auto boundary = isolation::derive_boundary(request.name);
    if (!confirm("Drop database " + boundary.database_name + " and all of its data?")) {
      std::cerr << "aborted\n";
      return 1;
    }
  }
  lock::ServiceLock service_lock(runtime.value()->config.paths.lock_dir, request.name);
  if (!take_lock(service_lock)) {
    return 1;
  }

  request.cancel = interrupt_token();
  auto result = runtime.value()->orchestrator->remove(request);
  if (!result.ok()) {
    return report_error(result.error());
  }
  std::cout << "Removed " << result.value().name;
  if (result.value().database_dropped) {
    std::cout << " (database dropped)";
  }
  std::cout << "\n";
  for (const auto &warning : result.value().warnings) {
    std::cerr << "warning: " << warning << "\n";
  }
  return 0;
}

int run_list() {
  auto runtime = build_runtime(false);
  if (!runtime.ok()) {
    std::cerr << "error: " << runtime.error() << "\n";
    return 1;
  }
  auto &orch = *runtime.value()->orchestrator;
  auto services = orch.list_services();
  if (!services.ok()) {
    return report_error(services.error());
  }
  if (services.value().empty()) {
    std::cout << "No services deployed.\n";
    return 0;
  }

  std::cout << std::left << std::setw(20) << "NAME" << std::setw(14) << "VERSION"
            << std::setw(7) << "PORT" << std::setw(32) << "ROUTE" << "STATUS\n";
  for (const auto &service : services.value()) {
    std::string live = "unknown";
    if (auto status = orch.service_status(service.name); status.ok()) {
      live = status.value().status_error.empty()
                 ? (status.value().active ? "active" : "inactive")
                 : "unknown";
    }
    std::cout << std::left << std::setw(20) << service.name << std::setw(14) << service.version
              << std::setw(7) << service.port << std::setw(32)
              << (service.route.empty() ? "-" : service.route.value) << live << "\n";
  }
  return 0;
}

int run_status(std::vector<std::string> args) {
  if (args.size() != 1) {
    std::cerr << "usage: berth status NAME\n";
    return 1;
  }
  auto runtime = build_runtime(false);
  if (!runtime.ok()) {
    std::cerr << "error: " << runtime.error() << "\n";
    return 1;
  }
  auto status = runtime.value()->orchestrator->service_status(args[0]);
  if (!status.ok()) {
    return report_error(status.error());
  }

  const auto &service = status.value().service;
  std::cout << "Name:       " << service.name << "\n";
  std::cout << "Repo:       " << service.repo << "\n";
  std::cout << "Version:    " << service.version << "\n";
  std::cout << "Previous:   " << service.previous_version.value_or("-") << "\n";
  std::cout << "Port:       " << service.port << "\n";
  std::cout << "Route:      " << describe_route(service.route) << "\n";
  std::cout << "Database:   " << (service.db_name.empty() ? "-" : service.db_name) << "\n";
  std::cout << "Deployed:   " << format_time(service.deployed_at) << "\n";
  std::cout << "Updated:    " << format_time(service.updated_at) << "\n";
  if (status.value().status_error.empty()) {
    std::cout << "Status:     " << (status.value().active ? "active" : "inactive") << "\n";
  } else {
    std::cout << "Status:     unknown (" << status.value().status_error << ")\n";
  }
  return 0;
}

void print_file_section(const std::string &title, const std::filesystem::path &path,
                        const bool mask) {
  std::cout << "== " << title << " (" << path.string() << ") ==\n";
  auto content = common::read_file(path);
  if (!content.ok()) {
    std::cout << "(unavailable: " << content.error() << ")\n\n";
    return;
  }
  std::cout << (mask ? mask_secrets(content.value()) : content.value());
  if (!content.value().empty() && content.value().back() != '\n') {
    std::cout << "\n";
  }
  std::cout << "\n";
}

int run_inspect(std::vector<std::string> args) {
  if (args.size() != 1) {
    std::cerr << "usage: berth inspect NAME\n";
    return 1;
  }
  auto runtime = build_runtime(false);
  if (!runtime.ok()) {
    std::cerr << "error: " << runtime.error() << "\n";
    return 1;
  }
  auto &rt = *runtime.value();
  auto service = rt.orchestrator->get_service(args[0]);
  if (!service.ok()) {
    return report_error(service.error());
  }
  if (!service.value().has_value()) {
    std::cerr << "error: service '" << args[0]
              << "' not found; run 'berth list' to see deployed services\n";
    return 1;
  }

  const auto boundary = isolation::derive_boundary(args[0]);
  print_file_section("unit", std::filesystem::path(rt.config.paths.unit_dir) / boundary.unit_name,
                     false);
  if (!service.value()->route.empty()) {
    print_file_section("route",
                       std::filesystem::path(rt.config.nginx.sites_dir) / boundary.route_config,
                       false);
  }
  print_file_section("secrets", rt.orchestrator->secrets_path(args[0]), true);
  return 0;
}

int run_history(std::vector<std::string> args) {
  if (args.size() != 1) {
    std::cerr << "usage: berth history NAME\n";
    return 1;
  }
  auto runtime = build_runtime(false);
  if (!runtime.ok()) {
    std::cerr << "error: " << runtime.error() << "\n";
    return 1;
  }
  auto entries = runtime.value()->orchestrator->history(args[0]);
  if (!entries.ok()) {
    return report_error(entries.error());
  }
  if (entries.value().empty()) {
    std::cout << "No history for " << args[0] << ".\n";
    return 0;
  }
  for (const auto &entry : entries.value()) {
    std::cout << format_time(entry.timestamp) << "  " << std::left << std::setw(9)
              << entry.action << std::setw(14) << entry.version;
    bool first = true;
    for (const auto &[key, detail] : entry.detail) {
      std::cout << (first ? "" : " ") << key << "=" << detail;
      first = false;
    }
    std::cout << "\n";
  }
  return 0;
}

int run_doctor() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << "[FAIL] Config load: " << cfg.error() << "\n";
    return 1;
  }

  runner::SystemCommandRunner runner;
  database::PostgresDatabaseManager database(postgres_options(cfg.value()));
  const auto report = doctor::run_diagnostics(cfg.value(), runner, database);
  doctor::print_diagnostics_report(report);
  return report.failed == 0 ? 0 : 1;
}

} // namespace

std::string version_string() {
#ifdef BERTH_VERSION
  const std::string version = BERTH_VERSION;
#else
  const std::string version = "0.1.0";
#endif
  return "berth " + version;
}

bool is_sensitive_key(const std::string &key) {
  const std::string upper = common::to_upper(common::trim(key));
  for (const char *marker : {"PASSWORD", "SECRET", "TOKEN", "KEY"}) {
    if (upper.find(marker) != std::string::npos) {
      return true;
    }
  }
  return false;
}

std::string mask_secrets(const std::string &content) {
  std::istringstream in(content);
  std::string out;
  std::string line;
  while (std::getline(in, line)) {
    const auto eq = line.find('=');
    const std::string trimmed = common::trim(line);
    if (eq != std::string::npos && !trimmed.empty() && trimmed.front() != '#' &&
        is_sensitive_key(line.substr(0, eq))) {
      const bool toml_style = eq > 0 && line[eq - 1] == ' ';
      line = line.substr(0, eq + 1) + (toml_style ? " \"********\"" : "********");
    }
    out += line;
    out += "\n";
  }
  return out;
}

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  berth" << RESET << DIM
            << "  single-host deploys with automatic cleanup" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "berth [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  SETUP" << RESET << "\n";
  std::cout << "  " << GREEN << "init" << RESET << DIM << "             Write a starter config and create directories" << RESET << "\n";
  std::cout << "  " << GREEN << "doctor" << RESET << DIM << "           Check config, database, systemd and nginx" << RESET << "\n\n";

  std::cout << BOLD << "  WORKFLOWS" << RESET << "\n";
  std::cout << "  " << GREEN << "deploy" << RESET << " REPO" << DIM << "      Fetch, provision, start and route a new service" << RESET << "\n";
  std::cout << DIM << "                   --name N --version V --port P --route R --env K=V --no-db --config-file" << RESET << "\n";
  std::cout << "  " << GREEN << "upgrade" << RESET << " NAME" << DIM << "     Switch to a new release; reverts if it fails to come up" << RESET << "\n";
  std::cout << DIM << "                   --version V" << RESET << "\n";
  std::cout << "  " << GREEN << "rollback" << RESET << " NAME" << DIM << "    Swap back to the previous release" << RESET << "\n";
  std::cout << "  " << GREEN << "remove" << RESET << " NAME" << DIM << "      Tear a service down" << RESET << "\n";
  std::cout << DIM << "                   --drop-db --yes" << RESET << "\n\n";

  std::cout << BOLD << "  INSPECTION" << RESET << "\n";
  std::cout << "  " << GREEN << "list" << RESET << DIM << "             Deployed services with live status" << RESET << "\n";
  std::cout << "  " << GREEN << "status" << RESET << " NAME" << DIM << "      One service in detail" << RESET << "\n";
  std::cout << "  " << GREEN << "inspect" << RESET << " NAME" << DIM << "     Generated unit, route and secrets files" << RESET << "\n";
  std::cout << "  " << GREEN << "history" << RESET << " NAME" << DIM << "     Deploy, upgrade, rollback and remove log" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "          Show version" << RESET << "\n";
  std::cout << "\n";
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    std::cout << config::config_path().string() << "\n";
    return 0;
  }
  if (subcommand == "init") {
    return run_init(std::move(args));
  }
  if (subcommand == "doctor") {
    return run_doctor();
  }
  if (subcommand == "list") {
    return run_list();
  }
  if (subcommand == "status") {
    return run_status(std::move(args));
  }
  if (subcommand == "inspect") {
    return run_inspect(std::move(args));
  }
  if (subcommand == "history") {
    return run_history(std::move(args));
  }

  install_interrupt_handlers();
  if (subcommand == "deploy") {
    return run_deploy(std::move(args));
  }
  if (subcommand == "upgrade") {
    return run_upgrade(std::move(args));
  }
  if (subcommand == "rollback") {
    return run_rollback(std::move(args));
  }
  if (subcommand == "remove") {
    return run_remove(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace berth::cli
