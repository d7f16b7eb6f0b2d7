#include "berth/doctor/diagnostics.hpp"

#include "berth/common/fs.hpp"
#include "berth/config/config.hpp"
#include "berth/state/store.hpp"

#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <unistd.h>

namespace berth::doctor {

namespace {

void add_check(DiagnosticsReport &report, DiagnosticCheck check) {
  switch (check.status) {
  case CheckStatus::Pass:
    ++report.passed;
    break;
  case CheckStatus::Fail:
    ++report.failed;
    break;
  case CheckStatus::Warn:
    ++report.warnings;
    break;
  }
  report.checks.push_back(std::move(check));
}

DiagnosticCheck check_config(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "Config";
  auto validation = config::validate_config(config);
  if (!validation.ok()) {
    check.status = CheckStatus::Fail;
    check.message = validation.error();
    return check;
  }

  if (!validation.value().empty()) {
    check.status = CheckStatus::Warn;
    check.message = validation.value().front();
    return check;
  }

  check.status = CheckStatus::Pass;
  check.message = config::config_path().string();
  return check;
}

DiagnosticCheck check_directory(const std::string &name, const std::string &path) {
  DiagnosticCheck check;
  check.name = name;
  std::error_code ec;
  if (!std::filesystem::is_directory(path, ec)) {
    check.status = CheckStatus::Warn;
    check.message = path + " missing (run 'berth init')";
    return check;
  }
  if (::access(path.c_str(), W_OK) != 0) {
    check.status = CheckStatus::Warn;
    check.message = path + " not writable by this user";
    return check;
  }
  check.status = CheckStatus::Pass;
  check.message = path;
  return check;
}

DiagnosticCheck check_state_store(const config::Config &config) {
  DiagnosticCheck check;
  check.name = "State";
  const std::filesystem::path path = config.paths.state_db;
  std::error_code ec;
  if (!std::filesystem::exists(path.parent_path(), ec)) {
    check.status = CheckStatus::Fail;
    check.message = path.parent_path().string() + " missing (run 'berth init')";
    return check;
  }

  state::StateStore store(path);
  if (auto status = store.open(); !status.ok()) {
    check.status = CheckStatus::Fail;
    check.message = status.error();
    return check;
  }
  auto services = store.list_services();
  if (!services.ok()) {
    check.status = CheckStatus::Fail;
    check.message = services.error();
    return check;
  }
  check.status = CheckStatus::Pass;
  check.message = path.string() + " services=" + std::to_string(services.value().size());
  return check;
}

DiagnosticCheck check_database(database::IDatabaseManager &database,
                               const config::Config &config) {
  DiagnosticCheck check;
  check.name = "Database";
  const auto start = std::chrono::steady_clock::now();
  const auto ping = database.ping();
  const auto end = std::chrono::steady_clock::now();
  check.latency = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);

  if (!ping.ok()) {
    check.status = CheckStatus::Fail;
    check.message = ping.error();
    return check;
  }
  check.status = CheckStatus::Pass;
  check.message = config.database.admin_user + "@" + config.database.host + ":" +
                  std::to_string(config.database.port);
  return check;
}

DiagnosticCheck check_tool(const std::string &program) {
  DiagnosticCheck check;
  check.name = "Tool:" + program;
  auto found = find_executable(program);
  if (!found.has_value()) {
    check.status = CheckStatus::Fail;
    check.message = "not found on PATH";
    return check;
  }
  check.status = CheckStatus::Pass;
  check.message = *found;
  return check;
}

DiagnosticCheck check_nginx_config(runner::ICommandRunner &runner) {
  DiagnosticCheck check;
  check.name = "Nginx config";
  runner::CommandOptions options;
  options.allow_failure = true;
  auto result = runner.run({"nginx", "-t"}, options);
  if (!result.ok()) {
    check.status = CheckStatus::Warn;
    check.message = result.error();
    return check;
  }
  if (result.value().exit_code != 0) {
    check.status = CheckStatus::Fail;
    check.message = common::trim(result.value().stderr_text);
    return check;
  }
  check.status = CheckStatus::Pass;
  check.message = "syntax ok";
  return check;
}

} // namespace

std::optional<std::string> find_executable(const std::string &program) {
  if (program.find('/') != std::string::npos) {
    if (::access(program.c_str(), X_OK) == 0) {
      return program;
    }
    return std::nullopt;
  }
  const char *path_env = std::getenv("PATH");
  std::stringstream dirs(path_env != nullptr ? path_env : "/usr/sbin:/usr/bin:/sbin:/bin");
  std::string dir;
  while (std::getline(dirs, dir, ':')) {
    if (dir.empty()) {
      continue;
    }
    const std::string candidate = (std::filesystem::path(dir) / program).string();
    if (::access(candidate.c_str(), X_OK) == 0) {
      return candidate;
    }
  }
  return std::nullopt;
}

DiagnosticsReport run_diagnostics(const config::Config &config, runner::ICommandRunner &runner,
                                  database::IDatabaseManager &database) {
  DiagnosticsReport report;

  add_check(report, check_config(config));
  add_check(report, check_directory("Binaries", config.paths.bin_dir));
  add_check(report, check_directory("Service config", config.paths.config_dir));
  add_check(report, check_directory("Locks", config.paths.lock_dir));
  add_check(report, check_state_store(config));
  add_check(report, check_database(database, config));

  for (const char *tool : {"systemctl", "journalctl", "useradd", "userdel", "nginx"}) {
    add_check(report, check_tool(tool));
  }
  add_check(report, check_directory("Nginx sites", config.nginx.sites_dir));
  add_check(report, check_directory("Nginx enabled", config.nginx.enabled_dir));
  add_check(report, check_nginx_config(runner));
  return report;
}

void print_diagnostics_report(const DiagnosticsReport &report) {
  auto status_prefix = [](CheckStatus status) -> const char * {
    switch (status) {
    case CheckStatus::Pass:
      return "[PASS]";
    case CheckStatus::Fail:
      return "[FAIL]";
    case CheckStatus::Warn:
      return "[WARN]";
    }
    return "[INFO]";
  };

  for (const auto &check : report.checks) {
    std::cout << status_prefix(check.status) << " " << check.name << ": " << check.message;
    if (check.latency.has_value()) {
      std::cout << " (" << check.latency->count() << "ms)";
    }
    std::cout << "\n";
  }

  std::cout << "Summary: " << report.passed << " passed, " << report.failed << " failed, "
            << report.warnings << " warnings\n";
}

} // namespace berth::doctor
