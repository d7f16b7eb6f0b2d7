#pragma once

#include "berth/common/cancellation.hpp"
#include "berth/creds/credentials.hpp"
#include "berth/state/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace berth::orchestrator {

struct DeployRequest {
  std::string repo;
  // Defaults to the last path segment of `repo`.
  std::string name;
  std::string version = "latest";
  std::optional<int> port;
  std::string route;
  state::EnvMap extra_env;
  bool skip_database = false;
  creds::SecretsFormat secrets_format = creds::SecretsFormat::Env;
  common::CancellationToken cancel;
};

struct DeployResult {
  state::Service service;
  std::filesystem::path artifact_path;
  std::string artifact_sha256;
  std::filesystem::path secrets_path;
  std::vector<std::string> warnings;
};

struct UpgradeRequest {
  std::string name;
  std::string version = "latest";
  common::CancellationToken cancel;
};

struct UpgradeResult {
  std::string name;
  std::string from_version;
  std::string to_version;
  // The resolved version was already installed; nothing was touched.
  bool no_change = false;
  // The new version failed to start or answer; the previous one is running again.
  bool rolled_back = false;
  std::string reason;
  std::vector<std::string> warnings;
};

struct RollbackRequest {
  std::string name;
  common::CancellationToken cancel;
};

struct RollbackResult {
  std::string name;
  std::string from_version;
  std::string to_version;
};

struct RemoveRequest {
  std::string name;
  bool drop_database = false;
  common::CancellationToken cancel;
};

struct RemoveResult {
  std::string name;
  bool database_dropped = false;
  // Best-effort teardown steps that failed.
  std::vector<std::string> warnings;
};

struct ServiceStatus {
  state::Service service;
  bool active = false;
  // Set when the supervisor could not be asked.
  std::string status_error;
};

} // namespace berth::orchestrator
