#include "berth/supervisor/supervisor.hpp"

#include "berth/common/fs.hpp"
#include "berth/isolation/boundary.hpp"

namespace berth::supervisor {

namespace {

constexpr int FAILURE_LOG_LINES = 20;

bool mentions(const std::string &text, const std::string &needle) {
  return !needle.empty() && common::to_lower(text).find(needle) != std::string::npos;
}

} // namespace

SystemdSupervisor::SystemdSupervisor(std::shared_ptr<runner::ICommandRunner> runner,
                                     SystemdOptions options, common::IClock &clock)
    : runner_(std::move(runner)), options_(std::move(options)), clock_(clock) {}

std::filesystem::path SystemdSupervisor::unit_path(const std::string &service) const {
  return options_.unit_dir / isolation::derive_boundary(service).unit_name;
}

common::Status SystemdSupervisor::systemctl(const std::string &verb, const std::string &unit,
                                            const common::CancellationToken &cancel,
                                            const std::string &tolerated) {
  std::vector<std::string> argv = {"systemctl", verb};
  if (!unit.empty()) {
    argv.push_back(unit);
  }
  auto result = runner_->run(argv, {.allow_failure = true, .cancel = cancel});
  if (!result.ok()) {
    return common::Status::error(result.error());
  }
  const auto &output = result.value();
  if (output.exit_code == 0 || mentions(output.stderr_text, tolerated)) {
    return common::Status::success();
  }
  const std::string detail = common::trim(output.stderr_text);
  return common::Status::error(runner::command_line(argv) + ": " +
                               (detail.empty() ? "exit status " + std::to_string(output.exit_code)
                                               : detail));
}

common::Result<bool> SystemdSupervisor::create_account(const std::string &service,
                                                       const common::CancellationToken &cancel) {
  const auto account = isolation::derive_boundary(service).account;
  auto result = runner_->run({"useradd", "--system", "--no-create-home", "--shell",
                              "/usr/sbin/nologin", "--user-group", account},
                             {.allow_failure = true, .cancel = cancel});
  if (!result.ok()) {
    return common::Result<bool>::failure(result.error());
  }
  if (result.value().exit_code == 0) {
    return common::Result<bool>::success(true);
  }
  // useradd exits 9 when the name is taken.
  if (result.value().exit_code == 9 || mentions(result.value().stderr_text, "already exists")) {
    return common::Result<bool>::success(false);
  }
  return common::Result<bool>::failure("useradd " + account + ": " +
                                       common::trim(result.value().stderr_text));
}

common::Status SystemdSupervisor::remove_account(const std::string &service,
                                                 const common::CancellationToken &cancel) {
  const auto account = isolation::derive_boundary(service).account;
  auto result = runner_->run({"userdel", account}, {.allow_failure = true, .cancel = cancel});
  if (!result.ok()) {
    return common::Status::error(result.error());
  }
  if (result.value().exit_code == 0 || mentions(result.value().stderr_text, "does not exist")) {
    return common::Status::success();
  }
  return common::Status::error("userdel " + account + ": " +
                               common::trim(result.value().stderr_text));
}

common::Status SystemdSupervisor::write_unit(const UnitSpec &spec) {
  const auto path = unit_path(spec.service);
  return common::write_file_atomic(path, render_unit(spec),
                                   std::filesystem::perms::owner_read |
                                       std::filesystem::perms::owner_write |
                                       std::filesystem::perms::group_read |
                                       std::filesystem::perms::others_read)
      .with_context("writing unit " + path.string());
}

common::Status SystemdSupervisor::remove_unit(const std::string &service) {
  std::error_code ec;
  const auto path = unit_path(service);
  std::filesystem::remove(path, ec);
  if (ec) {
    return common::Status::error("removing unit " + path.string() + ": " + ec.message());
  }
  return common::Status::success();
}

common::Status SystemdSupervisor::reload(const common::CancellationToken &cancel) {
  return systemctl("daemon-reload", "", cancel);
}

common::Status SystemdSupervisor::enable(const std::string &service,
                                         const common::CancellationToken &cancel) {
  return systemctl("enable", isolation::derive_boundary(service).unit_name, cancel);
}

common::Status SystemdSupervisor::disable(const std::string &service,
                                          const common::CancellationToken &cancel) {
  return systemctl("disable", isolation::derive_boundary(service).unit_name, cancel,
                   "not loaded");
}

common::Status SystemdSupervisor::stop(const std::string &service,
                                       const common::CancellationToken &cancel) {
  return systemctl("stop", isolation::derive_boundary(service).unit_name, cancel, "not loaded");
}

common::Status SystemdSupervisor::start(const std::string &service,
                                        const common::CancellationToken &cancel) {
  const auto unit = isolation::derive_boundary(service).unit_name;
  if (auto status = systemctl("start", unit, cancel); !status.ok()) {
    return common::Status::error(status.error() + "\nrecent logs:\n" +
                                 journal_tail(service, FAILURE_LOG_LINES));
  }

  const common::RetryPolicy policy{.interval = options_.poll_interval,
                                   .timeout = options_.start_timeout};
  const auto outcome = common::poll_until(
      clock_, policy,
      [this, &service] {
        auto active = is_active(service);
        return active.ok() && active.value();
      },
      cancel);

  if (outcome == common::PollOutcome::Satisfied) {
    return common::Status::success();
  }
  if (outcome == common::PollOutcome::Cancelled) {
    return common::Status::error("waiting for " + unit + " to start: cancelled");
  }
  return common::Status::error(unit + " did not become active within " +
                               std::to_string(options_.start_timeout.count() / 1000) +
                               "s\nrecent logs:\n" + journal_tail(service, FAILURE_LOG_LINES));
}

common::Result<bool> SystemdSupervisor::is_active(const std::string &service) {
  const auto unit = isolation::derive_boundary(service).unit_name;
  auto result = runner_->run({"systemctl", "is-active", unit}, {.allow_failure = true});
  if (!result.ok()) {
    return common::Result<bool>::failure(result.error());
  }
  return common::Result<bool>::success(result.value().exit_code == 0 &&
                                       common::trim(result.value().stdout_text) == "active");
}

std::string SystemdSupervisor::journal_tail(const std::string &service, const int lines) {
  const auto unit = isolation::derive_boundary(service).unit_name;
  auto result = runner_->run(
      {"journalctl", "-u", unit, "-n", std::to_string(lines), "--no-pager"},
      {.allow_failure = true});
  if (!result.ok()) {
    return "(journal unavailable: " + result.error() + ")";
  }
  return common::trim(result.value().stdout_text);
}

} // namespace berth::supervisor
