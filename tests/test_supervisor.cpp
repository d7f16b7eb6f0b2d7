#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "berth/common/fs.hpp"
#include "berth/runner/command_runner.hpp"
#include "berth/supervisor/supervisor.hpp"

#include <filesystem>
#include <memory>

namespace {

using berth::testing::FakeClock;
using berth::testing::FakeCommandRunner;
using berth::testing::ScriptedResponse;

constexpr const char *IS_ACTIVE = "systemctl is-active berth-api.service";

struct SupervisorFixture {
  berth::testing::TempDir dir;
  std::shared_ptr<FakeCommandRunner> runner = std::make_shared<FakeCommandRunner>();
  FakeClock clock;
  berth::supervisor::SystemdSupervisor supervisor;

  SupervisorFixture()
      : supervisor(runner,
                   berth::supervisor::SystemdOptions{.unit_dir = dir.path() / "units",
                                                     .start_timeout = std::chrono::seconds(2),
                                                     .poll_interval =
                                                         std::chrono::milliseconds(500)},
                   clock) {}
};

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

void register_supervisor_tests(std::vector<berth::tests::TestCase> &tests) {
  using berth::tests::require;

  tests.push_back({"runner_captures_output_and_exit_code", [] {
                     berth::runner::SystemCommandRunner runner;
                     auto echo = runner.run({"echo", "hello"});
                     require(echo.ok(), "echo runs");
                     require(echo.value().exit_code == 0, "exit 0");
                     require(berth::common::trim(echo.value().stdout_text) == "hello", "stdout");

                     auto failing = runner.run({"false"});
                     require(!failing.ok(), "non-zero exit is a failure");
                     require(contains(failing.error(), "exited with status 1"), "message");

                     auto tolerated = runner.run({"false"}, {.allow_failure = true});
                     require(tolerated.ok() && tolerated.value().exit_code == 1,
                             "allow_failure returns the exit code");
                   }});

  tests.push_back({"runner_reports_missing_program_and_stderr", [] {
                     berth::runner::SystemCommandRunner runner;
                     auto missing = runner.run({"berth-no-such-program-xyz"});
                     require(!missing.ok(), "missing program fails");
                     require(contains(missing.error(), "command not found"), "not found");

                     auto stderr_result = runner.run({"sh", "-c", "echo broken >&2; exit 3"});
                     require(!stderr_result.ok(), "fails");
                     require(contains(stderr_result.error(), "broken"), "stderr in message");
                     require(!runner.run({}).ok(), "empty argv rejected");
                   }});

  tests.push_back({"runner_enforces_timeout_and_cancellation", [] {
                     berth::runner::SystemCommandRunner runner;
                     auto slow = runner.run({"sleep", "5"},
                                            {.timeout = std::chrono::milliseconds(100)});
                     require(!slow.ok(), "timed out");
                     require(contains(slow.error(), "timed out"), "timeout message");

                     berth::common::CancellationToken cancel;
                     cancel.cancel();
                     berth::runner::CommandOptions options;
                     options.cancel = cancel;
                     auto cancelled = runner.run({"sleep", "5"}, options);
                     require(!cancelled.ok() && contains(cancelled.error(), "cancelled"),
                             "cancelled before running");
                   }});

  tests.push_back({"unit_template_runs_as_service_account", [] {
                     berth::supervisor::UnitSpec spec;
                     spec.service = "api";
                     spec.exec_start = "/opt/berth/bin/api/current";
                     spec.environment_file = "/etc/berth/api/env";
                     spec.working_directory = "/opt/berth/bin/api";
                     const std::string unit = berth::supervisor::render_unit(spec);
                     require(contains(unit, "ExecStart=/opt/berth/bin/api/current\n"), "exec");
                     require(contains(unit, "EnvironmentFile=/etc/berth/api/env\n"), "env file");
                     require(contains(unit, "User=berth-api\n"), "user");
                     require(contains(unit, "Group=berth-api\n"), "group");
                     require(contains(unit, "Restart=on-failure\n"), "restart policy");
                     require(contains(unit, "NoNewPrivileges=true\n"), "hardening");
                     require(contains(unit, "WantedBy=multi-user.target\n"), "install target");
                   }});

  tests.push_back({"supervisor_create_account_reports_whether_it_created", [] {
                     SupervisorFixture fx;
                     const berth::common::CancellationToken cancel;
                     auto created = fx.supervisor.create_account("api", cancel);
                     require(created.ok() && created.value(), "fresh account is created");
                     require(fx.runner->ran("useradd --system --no-create-home --shell "
                                            "/usr/sbin/nologin --user-group berth-api"),
                             "system account without login");

                     fx.runner->respond("useradd",
                                        ScriptedResponse{.exit_code = 9,
                                                         .stderr_text = "useradd: user "
                                                                        "'berth-api' already "
                                                                        "exists"});
                     auto existing = fx.supervisor.create_account("api", cancel);
                     require(existing.ok(), "existing user is not an error");
                     require(!existing.value(), "existing user was not created here");

                     fx.runner->respond("userdel", ScriptedResponse{.exit_code = 8,
                                                                    .stderr_text = "user busy"});
                     auto removed = fx.supervisor.remove_account("api", cancel);
                     require(!removed.ok(), "busy user is an error");
                     require(contains(removed.error(), "berth-api"), "names the account");
                   }});

  tests.push_back({"supervisor_writes_and_removes_unit_files", [] {
                     SupervisorFixture fx;
                     berth::supervisor::UnitSpec spec;
                     spec.service = "api";
                     spec.exec_start = "/opt/berth/bin/api/current";
                     require(fx.supervisor.write_unit(spec).ok(), "write");
                     const auto path = fx.supervisor.unit_path("api");
                     require(path.filename() == "berth-api.service", "unit file name");
                     require(berth::testing::read_text(path) ==
                                 berth::supervisor::render_unit(spec),
                             "rendered content");
                     require(fx.supervisor.remove_unit("api").ok(), "remove");
                     require(!std::filesystem::exists(path), "gone");
                     require(fx.supervisor.remove_unit("api").ok(), "second remove is fine");
                   }});

  tests.push_back({"supervisor_start_waits_until_active", [] {
                     SupervisorFixture fx;
                     fx.runner->respond(IS_ACTIVE, {.exit_code = 3, .stdout_text = "activating\n"});
                     fx.runner->respond(IS_ACTIVE, {.exit_code = 3, .stdout_text = "activating\n"});
                     fx.runner->respond(IS_ACTIVE, {.exit_code = 0, .stdout_text = "active\n"});
                     auto started = fx.supervisor.start("api", berth::common::CancellationToken{});
                     require(started.ok(), "start succeeds");
                     require(fx.runner->ran("systemctl start berth-api.service"), "started unit");
                     require(fx.runner->count(IS_ACTIVE) == 3, "polled until active");
                     require(fx.clock.sleeps() == 2, "slept between polls");
                   }});

  tests.push_back({"supervisor_start_timeout_includes_journal", [] {
                     SupervisorFixture fx;
                     fx.runner->respond(IS_ACTIVE, {.exit_code = 3, .stdout_text = "failed\n"});
                     fx.runner->respond("journalctl",
                                        {.stdout_text = "api[42]: listen: address in use\n"});
                     auto started = fx.supervisor.start("api", berth::common::CancellationToken{});
                     require(!started.ok(), "start fails");
                     require(contains(started.error(), "did not become active within 2s"),
                             "timeout message");
                     require(contains(started.error(), "address in use"), "journal tail attached");
                     require(fx.clock.slept() == std::chrono::seconds(2), "waited the timeout");
                   }});

  tests.push_back({"supervisor_start_command_failure_includes_journal", [] {
                     SupervisorFixture fx;
                     fx.runner->respond("systemctl start",
                                        {.exit_code = 1, .stderr_text = "Job failed"});
                     fx.runner->respond("journalctl", {.stdout_text = "exec format error"});
                     auto started = fx.supervisor.start("api", berth::common::CancellationToken{});
                     require(!started.ok(), "start fails");
                     require(contains(started.error(), "Job failed"), "systemctl stderr");
                     require(contains(started.error(), "exec format error"), "journal tail");
                     require(fx.runner->count(IS_ACTIVE) == 0, "no polling");
                   }});

  tests.push_back({"supervisor_stop_tolerates_unloaded_unit", [] {
                     SupervisorFixture fx;
                     fx.runner->respond("systemctl stop",
                                        {.exit_code = 5,
                                         .stderr_text = "Failed to stop berth-api.service: Unit "
                                                        "berth-api.service not loaded."});
                     const berth::common::CancellationToken cancel;
                     require(fx.supervisor.stop("api", cancel).ok(), "unloaded unit is stopped");
                     fx.runner->respond("systemctl enable", {.exit_code = 1,
                                                             .stderr_text = "not loaded"});
                     require(!fx.supervisor.enable("api", cancel).ok(), "enable is strict");
                     require(fx.supervisor.reload(cancel).ok(), "reload");
                     require(fx.runner->ran("systemctl daemon-reload"), "daemon-reload");
                   }});

  tests.push_back({"supervisor_is_active_reads_state", [] {
                     SupervisorFixture fx;
                     fx.runner->respond(IS_ACTIVE, {.exit_code = 0, .stdout_text = "active\n"});
                     auto active = fx.supervisor.is_active("api");
                     require(active.ok() && active.value(), "active");

                     SupervisorFixture inactive;
                     inactive.runner->respond(IS_ACTIVE,
                                              {.exit_code = 3, .stdout_text = "inactive\n"});
                     auto stopped = inactive.supervisor.is_active("api");
                     require(stopped.ok() && !stopped.value(), "inactive");
                   }});

  tests.push_back({"supervisor_commands_honour_cancellation", [] {
                     SupervisorFixture fx;
                     berth::common::CancellationToken cancel;
                     cancel.cancel();
                     auto account = fx.supervisor.create_account("api", cancel);
                     require(!account.ok() && contains(account.error(), "cancelled"),
                             "useradd is not run");
                     require(!fx.supervisor.stop("api", cancel).ok(), "stop cancelled");
                     require(!fx.supervisor.reload(cancel).ok(), "reload cancelled");
                     require(!fx.supervisor.remove_account("api", cancel).ok(),
                             "userdel cancelled");
                     require(fx.runner->calls().empty(), "nothing ran");
                   }});
}
