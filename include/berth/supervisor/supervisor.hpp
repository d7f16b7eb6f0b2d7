#pragma once

#include "berth/common/cancellation.hpp"
#include "berth/common/poll.hpp"
#include "berth/common/result.hpp"
#include "berth/runner/command_runner.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <string>

namespace berth::supervisor {

struct UnitSpec {
  std::string service;
  std::filesystem::path exec_start;
  std::filesystem::path environment_file;
  std::filesystem::path working_directory;
};

[[nodiscard]] std::string render_unit(const UnitSpec &spec);

/// Every call takes the service name; unit and account names are derived from it.
class IProcessSupervisor {
public:
  virtual ~IProcessSupervisor() = default;

  /// True when the account was created, false when it already existed.
  [[nodiscard]] virtual common::Result<bool>
  create_account(const std::string &service, const common::CancellationToken &cancel) = 0;
  [[nodiscard]] virtual common::Status remove_account(const std::string &service,
                                                      const common::CancellationToken &cancel) = 0;
  [[nodiscard]] virtual common::Status write_unit(const UnitSpec &spec) = 0;
  [[nodiscard]] virtual common::Status remove_unit(const std::string &service) = 0;
  [[nodiscard]] virtual common::Status reload(const common::CancellationToken &cancel) = 0;
  [[nodiscard]] virtual common::Status enable(const std::string &service,
                                              const common::CancellationToken &cancel) = 0;
  [[nodiscard]] virtual common::Status disable(const std::string &service,
                                               const common::CancellationToken &cancel) = 0;
  /// Starts the unit and waits for it to report active; the error carries the log tail.
  [[nodiscard]] virtual common::Status start(const std::string &service,
                                             const common::CancellationToken &cancel) = 0;
  [[nodiscard]] virtual common::Status stop(const std::string &service,
                                            const common::CancellationToken &cancel) = 0;
  [[nodiscard]] virtual common::Result<bool> is_active(const std::string &service) = 0;
  [[nodiscard]] virtual std::string journal_tail(const std::string &service, int lines) = 0;
};

struct SystemdOptions {
  std::filesystem::path unit_dir = "/etc/systemd/system";
  std::chrono::milliseconds start_timeout{10'000};
  std::chrono::milliseconds poll_interval{500};
};

class SystemdSupervisor final : public IProcessSupervisor {
public:
  SystemdSupervisor(std::shared_ptr<runner::ICommandRunner> runner, SystemdOptions options,
                    common::IClock &clock);

  [[nodiscard]] common::Result<bool>
  create_account(const std::string &service, const common::CancellationToken &cancel) override;
  [[nodiscard]] common::Status remove_account(const std::string &service,
                                              const common::CancellationToken &cancel) override;
  [[nodiscard]] common::Status write_unit(const UnitSpec &spec) override;
  [[nodiscard]] common::Status remove_unit(const std::string &service) override;
  [[nodiscard]] common::Status reload(const common::CancellationToken &cancel) override;
  [[nodiscard]] common::Status enable(const std::string &service,
                                      const common::CancellationToken &cancel) override;
  [[nodiscard]] common::Status disable(const std::string &service,
                                       const common::CancellationToken &cancel) override;
  [[nodiscard]] common::Status start(const std::string &service,
                                     const common::CancellationToken &cancel) override;
  [[nodiscard]] common::Status stop(const std::string &service,
                                    const common::CancellationToken &cancel) override;
  [[nodiscard]] common::Result<bool> is_active(const std::string &service) override;
  [[nodiscard]] std::string journal_tail(const std::string &service, int lines) override;

  [[nodiscard]] std::filesystem::path unit_path(const std::string &service) const;

private:
  [[nodiscard]] common::Status systemctl(const std::string &verb, const std::string &unit,
                                         const common::CancellationToken &cancel,
                                         const std::string &tolerated = "");

  std::shared_ptr<runner::ICommandRunner> runner_;
  SystemdOptions options_;
  common::IClock &clock_;
};

} // namespace berth::supervisor
