#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "berth/doctor/diagnostics.hpp"
#include "berth/observability/factory.hpp"
#include "berth/observability/global.hpp"
#include "berth/observability/log_observer.hpp"
#include "berth/orchestrator/journal.hpp"

#include <algorithm>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <variant>

namespace {

struct CounterState {
  int events = 0;
  int metrics = 0;
  int compensations = 0;
};

class CountingObserver final : public berth::observability::IObserver {
public:
  explicit CountingObserver(CounterState *state) : state_(state) {}

  void record_event(const berth::observability::ObserverEvent &event) override {
    ++state_->events;
    if (std::holds_alternative<berth::observability::CompensationEvent>(event)) {
      ++state_->compensations;
    }
  }
  void record_metric(const berth::observability::ObserverMetric &) override {
    ++state_->metrics;
  }
  [[nodiscard]] std::string_view name() const override { return "counting"; }

private:
  CounterState *state_ = nullptr;
};

const berth::doctor::DiagnosticCheck *find_check(const berth::doctor::DiagnosticsReport &report,
                                                 const std::string &name) {
  auto it = std::find_if(report.checks.begin(), report.checks.end(),
                         [&name](const auto &check) { return check.name == name; });
  return it == report.checks.end() ? nullptr : &*it;
}

} // namespace

void register_observability_doctor_tests(std::vector<berth::tests::TestCase> &tests) {
  using berth::tests::require;
  namespace ob = berth::observability;
  namespace dr = berth::doctor;

  tests.push_back({"observability_factory_picks_backend", [] {
                     auto config = berth::testing::mock_config();
                     require(ob::create_observer(config)->name() == "noop", "none is noop");
                     config.observability.backend = "log";
                     require(ob::create_observer(config)->name() == "log", "log backend");
                     config.observability.backend = "mystery";
                     require(ob::create_observer(config)->name() == "log", "unknown falls back");
                   }});

  tests.push_back({"observability_log_observer_formats_lines", [] {
                     std::ostringstream out;
                     ob::LogObserver observer(out);
                     observer.record_event(ob::WorkflowStepEvent{.workflow = "deploy",
                                                                 .service = "api",
                                                                 .step = "route",
                                                                 .success = false,
                                                                 .detail = "nginx -t failed"});
                     observer.record_event(ob::ErrorEvent{.component = "state",
                                                          .message = "disk full"});
                     const std::string text = out.str();
                     require(text.find("[WARN] deploy.step service=api step=route success=false "
                                       "nginx -t failed") != std::string::npos,
                             "failed step logs a warning");
                     require(text.find("[ERROR] state: disk full") != std::string::npos,
                             "error line");
                   }});

  tests.push_back({"observability_global_receives_compensations", [] {
                     CounterState state;
                     ob::set_global_observer(std::make_unique<CountingObserver>(&state));

                     berth::orchestrator::RollbackJournal journal("api");
                     journal.record(berth::orchestrator::StepKind::Artifact, "artifacts",
                                    [] { return berth::common::Status::success(); });
                     journal.record(berth::orchestrator::StepKind::Unit, "unit",
                                    [] { return berth::common::Status::error("busy"); });
                     auto report = journal.unwind();
                     require(!report.clean(), "one compensation failed");
                     require(state.compensations == 2, "each compensation recorded");

                     ob::record_workflow_end("deploy", "api", "failed",
                                             std::chrono::milliseconds(12));
                     require(state.events == 3, "end event recorded");

                     // state lives on this stack frame
                     ob::set_global_observer(nullptr);
                   }});

  tests.push_back({"doctor_reports_tools_and_directories", [] {
                     berth::testing::TempDir dir;
                     auto config = berth::testing::mock_config();
                     config.paths.bin_dir = (dir.path() / "bin").string();
                     config.paths.config_dir = (dir.path() / "etc").string();
                     config.paths.lock_dir = (dir.path() / "missing-locks").string();
                     config.paths.state_db = (dir.path() / "state.db").string();
                     config.nginx.sites_dir = (dir.path() / "sites").string();
                     config.nginx.enabled_dir = (dir.path() / "enabled").string();
                     std::filesystem::create_directories(dir.path() / "bin");
                     std::filesystem::create_directories(dir.path() / "etc");

                     berth::testing::FakeCommandRunner runner;
                     berth::testing::FakeDatabase database;
                     const auto report = dr::run_diagnostics(config, runner, database);

                     const auto *bin = find_check(report, "Binaries");
                     require(bin != nullptr && bin->status == dr::CheckStatus::Pass, "bin dir ok");
                     const auto *locks = find_check(report, "Locks");
                     require(locks != nullptr && locks->status == dr::CheckStatus::Warn,
                             "missing lock dir warns");
                     const auto *state = find_check(report, "State");
                     require(state != nullptr && state->status == dr::CheckStatus::Pass,
                             "state store opens");
                     const auto *db = find_check(report, "Database");
                     require(db != nullptr && db->status == dr::CheckStatus::Pass &&
                                 db->latency.has_value(),
                             "database ping with latency");
                     require(find_check(report, "Tool:systemctl") != nullptr, "tool check");
                     const auto *nginx = find_check(report, "Nginx config");
                     require(nginx != nullptr && nginx->status == dr::CheckStatus::Pass,
                             "nginx -t passes");
                     require(runner.ran("nginx -t"), "ran nginx -t");
                     require(report.passed + report.failed + report.warnings ==
                                 static_cast<int>(report.checks.size()),
                             "counts add up");
                   }});

  tests.push_back({"doctor_flags_database_and_nginx_failures", [] {
                     berth::testing::TempDir dir;
                     auto config = berth::testing::mock_config();
                     config.paths.state_db = (dir.path() / "state.db").string();
                     berth::testing::FakeCommandRunner runner;
                     runner.respond("nginx -t", {.exit_code = 1,
                                                 .stderr_text = "nginx: [emerg] bad directive"});
                     berth::testing::FakeDatabase database;
                     database.fail_ping = "connection refused";
                     const auto report = dr::run_diagnostics(config, runner, database);

                     const auto *db = find_check(report, "Database");
                     require(db != nullptr && db->status == dr::CheckStatus::Fail, "db fails");
                     require(db->message == "connection refused", "db message");
                     const auto *nginx = find_check(report, "Nginx config");
                     require(nginx != nullptr && nginx->status == dr::CheckStatus::Fail,
                             "nginx fails");
                     require(nginx->message.find("bad directive") != std::string::npos,
                             "nginx stderr");
                     require(report.failed >= 2, "failures counted");
                   }});

  tests.push_back({"doctor_find_executable_searches_path", [] {
                     require(dr::find_executable("sh").has_value(), "sh is on PATH");
                     require(!dr::find_executable("berth-no-such-tool-xyz").has_value(),
                             "unknown tool");
                     require(dr::find_executable("/bin/sh") == std::optional<std::string>("/bin/sh"),
                             "absolute path");
                   }});
}
