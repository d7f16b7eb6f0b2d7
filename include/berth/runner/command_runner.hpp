#pragma once

#include "berth/common/cancellation.hpp"
#include "berth/common/result.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace berth::runner {

struct CommandOptions {
  bool allow_failure = false;
  std::chrono::milliseconds timeout{60'000};
  common::CancellationToken cancel;
};

struct CommandResult {
  int exit_code = 0;
  std::string stdout_text;
  std::string stderr_text;
};

/// Runs argv[0] from PATH with the remaining entries as arguments.
class ICommandRunner {
public:
  virtual ~ICommandRunner() = default;

  [[nodiscard]] virtual common::Result<CommandResult>
  run(const std::vector<std::string> &argv, const CommandOptions &options = {}) = 0;
};

class SystemCommandRunner final : public ICommandRunner {
public:
  [[nodiscard]] common::Result<CommandResult>
  run(const std::vector<std::string> &argv, const CommandOptions &options = {}) override;
};

[[nodiscard]] std::string command_line(const std::vector<std::string> &argv);

} // namespace berth::runner
