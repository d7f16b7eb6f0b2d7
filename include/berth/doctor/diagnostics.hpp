#pragma once

#include "berth/config/schema.hpp"
#include "berth/database/manager.hpp"
#include "berth/runner/command_runner.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace berth::doctor {

enum class CheckStatus {
  Pass,
  Fail,
  Warn,
};

struct DiagnosticCheck {
  std::string name;
  CheckStatus status = CheckStatus::Pass;
  std::string message;
  std::optional<std::chrono::milliseconds> latency;
};

struct DiagnosticsReport {
  std::vector<DiagnosticCheck> checks;
  int passed = 0;
  int failed = 0;
  int warnings = 0;
};

[[nodiscard]] DiagnosticsReport run_diagnostics(const config::Config &config,
                                                runner::ICommandRunner &runner,
                                                database::IDatabaseManager &database);
void print_diagnostics_report(const DiagnosticsReport &report);

/// Looks `program` up on PATH the way execvp would.
[[nodiscard]] std::optional<std::string> find_executable(const std::string &program);

} // namespace berth::doctor
