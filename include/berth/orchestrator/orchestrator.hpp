#pragma once

#include "berth/artifact/store.hpp"
#include "berth/creds/credentials.hpp"
#include "berth/database/manager.hpp"
#include "berth/fetch/release_fetcher.hpp"
#include "berth/health/port_check.hpp"
#include "berth/orchestrator/errors.hpp"
#include "berth/orchestrator/requests.hpp"
#include "berth/proxy/proxy.hpp"
#include "berth/state/store.hpp"
#include "berth/supervisor/supervisor.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace berth::orchestrator {

struct Collaborators {
  std::shared_ptr<fetch::IArtifactFetcher> fetcher;
  std::shared_ptr<supervisor::IProcessSupervisor> supervisor;
  std::shared_ptr<proxy::IProxyManager> proxy;
  std::shared_ptr<database::IDatabaseManager> database;
  std::shared_ptr<creds::ICredentialWriter> credentials;
  std::shared_ptr<health::IHealthChecker> health;
  std::shared_ptr<artifact::ArtifactStore> artifacts;
  std::shared_ptr<state::StateStore> store;
};

struct OrchestratorSettings {
  std::filesystem::path config_dir = "/etc/berth";
  int port_range_start = 3000;
  int port_range_end = 4000;
  std::chrono::milliseconds health_timeout{10'000};
  // Unix seconds; replaced in tests.
  std::function<std::int64_t()> now;
};

/// Runs the deploy, upgrade, rollback and remove workflows for one host.
/// Calls are synchronous. No lock is taken on the service name, so callers that can run
/// concurrently must serialize on it themselves.
class Orchestrator {
public:
  Orchestrator(Collaborators collaborators, OrchestratorSettings settings);

  [[nodiscard]] WorkflowResult<DeployResult> deploy(const DeployRequest &request);
  [[nodiscard]] WorkflowResult<UpgradeResult> upgrade(const UpgradeRequest &request);
  [[nodiscard]] WorkflowResult<RollbackResult> rollback(const RollbackRequest &request);
  [[nodiscard]] WorkflowResult<RemoveResult> remove(const RemoveRequest &request);

  [[nodiscard]] WorkflowResult<std::optional<state::Service>> get_service(const std::string &name);
  [[nodiscard]] WorkflowResult<std::vector<state::Service>> list_services();
  [[nodiscard]] WorkflowResult<ServiceStatus> service_status(const std::string &name);
  [[nodiscard]] WorkflowResult<std::vector<state::HistoryEntry>>
  history(const std::string &name);

  [[nodiscard]] std::filesystem::path secrets_path(const std::string &name) const;
  [[nodiscard]] std::filesystem::path secrets_dir(const std::string &name) const;

private:
  [[nodiscard]] WorkflowResult<state::Service> load_existing(const std::string &workflow,
                                                            const std::string &name);
  [[nodiscard]] std::int64_t now() const;
  void append_history(const std::string &service, state::HistoryAction action,
                      const std::string &version, state::EnvMap detail);

  Collaborators c_;
  OrchestratorSettings settings_;
};

/// "owner/api" and "api" both give "api"; a trailing ".git" is dropped.
[[nodiscard]] std::string default_service_name(const std::string &repo);

} // namespace berth::orchestrator
