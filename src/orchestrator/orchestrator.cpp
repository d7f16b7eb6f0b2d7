#include "berth/orchestrator/orchestrator.hpp"

#include "berth/common/fs.hpp"
#include "berth/isolation/boundary.hpp"
#include "berth/observability/global.hpp"
#include "berth/orchestrator/journal.hpp"
#include "berth/ports/allocator.hpp"

#include <cctype>
#include <utility>

namespace berth::orchestrator {

namespace {

constexpr const char *DEPLOY = "deploy";
constexpr const char *UPGRADE = "upgrade";
constexpr const char *ROLLBACK = "rollback";
constexpr const char *REMOVE = "remove";

WorkflowError make_error(const ErrorKind kind, const std::string &workflow,
                         const std::string &service, std::string message) {
  WorkflowError error;
  error.kind = kind;
  error.workflow = workflow;
  error.service = service;
  error.message = std::move(message);
  return error;
}

/// Reports the end of a workflow exactly once.
class WorkflowSpan {
public:
  WorkflowSpan(std::string workflow, std::string service)
      : workflow_(std::move(workflow)), service_(std::move(service)),
        started_(std::chrono::steady_clock::now()) {
    observability::record_workflow_start(workflow_, service_);
  }

  ~WorkflowSpan() { finish("aborted"); }

  WorkflowSpan(const WorkflowSpan &) = delete;
  WorkflowSpan &operator=(const WorkflowSpan &) = delete;

  void step(const std::string &name, const bool success, const std::string &detail = "") const {
    observability::record_workflow_step(workflow_, service_, name, success, detail);
  }

  void finish(const std::string &outcome) {
    if (finished_) {
      return;
    }
    finished_ = true;
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_);
    observability::record_workflow_end(workflow_, service_, outcome, elapsed);
  }

  template <typename T> WorkflowResult<T> fail(WorkflowError error) {
    observability::record_error("orchestrator", error.to_string());
    finish("failed");
    return WorkflowResult<T>::failure(std::move(error));
  }

private:
  std::string workflow_;
  std::string service_;
  std::chrono::steady_clock::time_point started_;
  bool finished_ = false;
};

bool valid_env_key(const std::string &key) {
  if (key.empty() || std::isdigit(static_cast<unsigned char>(key.front())) != 0) {
    return false;
  }
  for (const char ch : key) {
    if (std::isalnum(static_cast<unsigned char>(ch)) == 0 && ch != '_') {
      return false;
    }
  }
  return true;
}

/// Stop, disable and remove the unit, then reload. Every step runs.
common::Status teardown_unit(supervisor::IProcessSupervisor &supervisor,
                             const std::string &service,
                             const common::CancellationToken &cancel) {
  std::vector<std::string> errors;
  if (auto status = supervisor.stop(service, cancel); !status.ok()) {
    errors.push_back(status.error());
  }
  if (auto status = supervisor.disable(service, cancel); !status.ok()) {
    errors.push_back(status.error());
  }
  if (auto status = supervisor.remove_unit(service); !status.ok()) {
    errors.push_back(status.error());
  }
  if (auto status = supervisor.reload(cancel); !status.ok()) {
    errors.push_back(status.error());
  }
  if (errors.empty()) {
    return common::Status::success();
  }
  return common::Status::error(common::join(errors, "; "));
}

} // namespace

std::string default_service_name(const std::string &repo) {
  std::string name = common::trim(repo);
  while (!name.empty() && name.back() == '/') {
    name.pop_back();
  }
  const auto slash = name.find_last_of('/');
  if (slash != std::string::npos) {
    name = name.substr(slash + 1);
  }
  if (common::ends_with(name, ".git")) {
    name.resize(name.size() - 4);
  }
  return name;
}

Orchestrator::Orchestrator(Collaborators collaborators, OrchestratorSettings settings)
    : c_(std::move(collaborators)), settings_(std::move(settings)) {}

std::filesystem::path Orchestrator::secrets_dir(const std::string &name) const {
  return settings_.config_dir / name;
}

std::filesystem::path Orchestrator::secrets_path(const std::string &name) const {
  return secrets_dir(name) / "env";
}

std::int64_t Orchestrator::now() const {
  if (settings_.now) {
    return settings_.now();
  }
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

void Orchestrator::append_history(const std::string &service, const state::HistoryAction action,
                                  const std::string &version, state::EnvMap detail) {
  state::HistoryEntry entry;
  entry.service = service;
  entry.action = state::history_action_to_string(action);
  entry.version = version;
  entry.timestamp = now();
  entry.detail = std::move(detail);
  // The ledger is an audit trail only; a failed append does not undo the workflow.
  if (auto status = c_.store->append_history(entry); !status.ok()) {
    observability::record_error("state", "appending history for " + service + ": " +
                                             status.error());
  }
}

WorkflowResult<state::Service> Orchestrator::load_existing(const std::string &workflow,
                                                           const std::string &name) {
  using LoadResult = WorkflowResult<state::Service>;
  auto found = c_.store->get_service(name);
  if (!found.ok()) {
    return LoadResult::failure(
        make_error(ErrorKind::Dependency, workflow, name, "reading state: " + found.error()));
  }
  if (!found.value().has_value()) {
    return LoadResult::failure(
        make_error(ErrorKind::NotFound, workflow, name,
                   "service '" + name + "' not found; run 'berth list' to see deployed services"));
  }
  return LoadResult::success(std::move(*found.value()));
}

WorkflowResult<DeployResult> Orchestrator::deploy(const DeployRequest &request) {
  const std::string name = request.name.empty() ? default_service_name(request.repo) : request.name;
  WorkflowSpan span(DEPLOY, name);
  auto reject = [&](const ErrorKind kind, std::string message) {
    return span.fail<DeployResult>(make_error(kind, DEPLOY, name, std::move(message)));
  };

  if (common::trim(request.repo).empty()) {
    return reject(ErrorKind::Validation, "repository reference is required");
  }
  if (auto status = isolation::validate_service_name(name); !status.ok()) {
    return reject(ErrorKind::Validation, status.error());
  }
  auto route = proxy::infer_route(request.route);
  if (!route.ok()) {
    return reject(ErrorKind::Validation, route.error());
  }
  for (const auto &[key, value] : request.extra_env) {
    if (!valid_env_key(key)) {
      return reject(ErrorKind::Validation, "invalid environment variable name \"" + key + "\"");
    }
  }

  auto existing = c_.store->get_service(name);
  if (!existing.ok()) {
    return reject(ErrorKind::Dependency, "reading state: " + existing.error());
  }
  if (existing.value().has_value()) {
    return reject(ErrorKind::Conflict, "service '" + name + "' already exists");
  }

  ports::PortAllocator allocator(settings_.port_range_start, settings_.port_range_end,
                                 *c_.store);
  int port = 0;
  if (request.port.has_value()) {
    auto check = allocator.check(*request.port);
    if (!check.ok()) {
      return reject(ErrorKind::Dependency, check.error());
    }
    if (check.value().verdict == ports::PortVerdict::OutOfRange) {
      return reject(ErrorKind::Validation, check.value().message);
    }
    if (check.value().verdict == ports::PortVerdict::Taken) {
      return reject(ErrorKind::Conflict, check.value().message);
    }
    port = *request.port;
  } else {
    auto next = allocator.next();
    if (!next.ok()) {
      return reject(ErrorKind::Conflict, next.error());
    }
    port = next.value();
  }

  auto version = c_.fetcher->resolve_version(request.repo, request.version, request.cancel);
  if (!version.ok()) {
    return reject(ErrorKind::Dependency, "resolving version: " + version.error());
  }
  span.step("resolve", true, version.value());

  RollbackJournal journal(name);
  auto abort = [&](std::string message) {
    WorkflowError error = make_error(ErrorKind::Dependency, DEPLOY, name, std::move(message));
    if (request.cancel.cancelled()) {
      error.message += " (cancelled; completed steps were left in place)";
      error.manual_cleanup = journal.outstanding();
    } else {
      auto report = journal.unwind();
      error.compensation_failures = std::move(report.failures);
      error.manual_cleanup = std::move(report.manual_cleanup);
    }
    return span.fail<DeployResult>(std::move(error));
  };
  auto interrupted = [&]() { return request.cancel.cancelled(); };

  auto fetched = c_.fetcher->fetch_artifact(request.repo, version.value(), name, request.cancel);
  if (!fetched.ok()) {
    return abort("fetching artifact: " + fetched.error());
  }
  auto artifacts = c_.artifacts;
  journal.record(StepKind::Artifact, "artifacts in " + artifacts->service_dir(name).string(),
                 [artifacts, name]() { return artifacts->remove_all(name); });
  span.step("artifact", true, fetched.value().sha256);
  if (interrupted()) {
    return abort("interrupted after fetching artifact");
  }

  const auto boundary = isolation::derive_boundary(name);
  std::optional<database::DatabaseCredentials> database;
  if (!request.skip_database) {
    auto created = c_.database->create_database(name);
    if (!created.ok()) {
      return abort("provisioning database: " + created.error());
    }
    database = std::move(created.value());
    auto manager = c_.database;
    journal.record(StepKind::Database,
                   "database " + database->db_name + " and role " + database->db_user,
                   [manager, name]() { return manager->drop_database(name); });
    span.step("database", true, database->db_name);
    if (interrupted()) {
      return abort("interrupted after provisioning database");
    }
  }

  creds::SecretEntries entries;
  entries["PORT"] = std::to_string(port);
  if (database.has_value()) {
    entries["DB_HOST"] = database->host;
    entries["DB_PORT"] = std::to_string(database->port);
    entries["DB_NAME"] = database->db_name;
    entries["DB_USER"] = database->db_user;
    entries["DB_PASSWORD"] = database->password;
  }
  for (const auto &[key, value] : request.extra_env) {
    entries[key] = value;
  }
  const auto secrets = secrets_path(name);
  if (auto status = c_.credentials->write_secrets(secrets, entries, request.secrets_format);
      !status.ok()) {
    return abort("writing secrets: " + status.error());
  }
  auto credentials = c_.credentials;
  const auto secrets_directory = secrets_dir(name);
  journal.record(StepKind::Secrets, "secrets in " + secrets_directory.string(),
                 [credentials, secrets_directory]() {
                   return credentials->remove_secrets(secrets_directory);
                 });
  span.step("secrets", true, secrets.string());

  auto supervisor = c_.supervisor;
  auto account = supervisor->create_account(name, request.cancel);
  if (!account.ok()) {
    return abort("creating account " + boundary.account + ": " + account.error());
  }
  // An account that was already there is not ours to delete on failure.
  if (account.value()) {
    journal.record(StepKind::Account, "system account " + boundary.account, [supervisor, name]() {
      return supervisor->remove_account(name, common::CancellationToken{});
    });
  }
  span.step("account", true, account.value() ? "created" : "already existed");

  supervisor::UnitSpec unit;
  unit.service = name;
  unit.exec_start = artifacts->current_path(name);
  unit.environment_file = secrets;
  unit.working_directory = artifacts->service_dir(name);
  if (auto status = supervisor->write_unit(unit); !status.ok()) {
    return abort("writing unit " + boundary.unit_name + ": " + status.error());
  }
  journal.record(StepKind::Unit, "unit " + boundary.unit_name,
                 [supervisor, name]() {
                   return teardown_unit(*supervisor, name, common::CancellationToken{});
                 });
  if (interrupted()) {
    return abort("interrupted after writing unit");
  }

  if (auto status = supervisor->reload(request.cancel); !status.ok()) {
    return abort("reloading units: " + status.error());
  }
  if (auto status = supervisor->enable(name, request.cancel); !status.ok()) {
    return abort("enabling " + boundary.unit_name + ": " + status.error());
  }
  if (auto status = supervisor->start(name, request.cancel); !status.ok()) {
    return abort("starting " + boundary.unit_name + ": " + status.error());
  }
  span.step("start", true, boundary.unit_name);

  DeployResult result;
  state::Route active_route;
  if (!route.value().empty()) {
    auto proxy = c_.proxy;
    if (auto status = proxy->activate_route(name, route.value(), port); status.ok()) {
      active_route = route.value();
      journal.record(StepKind::Route, "route config " + boundary.route_config,
                     [proxy, name]() { return proxy->deactivate_route(name); });
      span.step("route", true, active_route.value);
    } else {
      result.warnings.push_back("route " + route.value().value +
                                " was not activated: " + status.error());
      span.step("route", false, status.error());
    }
  }

  state::Service record;
  record.name = name;
  record.repo = request.repo;
  record.version = version.value();
  record.port = port;
  record.route = active_route;
  if (database.has_value()) {
    record.db_name = database->db_name;
    record.db_user = database->db_user;
  }
  record.extra_env = request.extra_env;
  record.deployed_at = now();
  record.updated_at = record.deployed_at;
  if (auto status = c_.store->insert_service(record); !status.ok()) {
    return abort("recording state: " + status.error());
  }
  append_history(name, state::HistoryAction::Deploy, record.version,
                 {{"port", std::to_string(port)}});

  result.service = std::move(record);
  result.artifact_path = fetched.value().path;
  result.artifact_sha256 = fetched.value().sha256;
  result.secrets_path = secrets;
  span.finish("succeeded");
  return WorkflowResult<DeployResult>::success(std::move(result));
}

WorkflowResult<UpgradeResult> Orchestrator::upgrade(const UpgradeRequest &request) {
  const std::string &name = request.name;
  WorkflowSpan span(UPGRADE, name);

  auto loaded = load_existing(UPGRADE, name);
  if (!loaded.ok()) {
    return span.fail<UpgradeResult>(loaded.error());
  }
  state::Service service = loaded.value();
  const std::string old_version = service.version;
  const auto boundary = isolation::derive_boundary(name);

  auto fail = [&](std::string message, std::vector<std::string> cleanup = {},
                  std::vector<std::string> compensation_failures = {}) {
    WorkflowError error = make_error(ErrorKind::Dependency, UPGRADE, name, std::move(message));
    error.manual_cleanup = std::move(cleanup);
    error.compensation_failures = std::move(compensation_failures);
    return span.fail<UpgradeResult>(std::move(error));
  };

  auto version = c_.fetcher->resolve_version(service.repo, request.version, request.cancel);
  if (!version.ok()) {
    return fail("resolving version: " + version.error());
  }
  const std::string new_version = version.value();

  UpgradeResult result;
  result.name = name;
  result.from_version = old_version;
  result.to_version = new_version;
  if (new_version == old_version) {
    result.no_change = true;
    span.finish("no_change");
    return WorkflowResult<UpgradeResult>::success(std::move(result));
  }

  auto fetched = c_.fetcher->fetch_artifact(service.repo, new_version, name, request.cancel);
  if (!fetched.ok()) {
    std::vector<std::string> cleanup;
    if (auto current = c_.artifacts->current_version(name);
        current.ok() && current.value() != std::optional<std::string>(old_version)) {
      if (auto status = c_.artifacts->point_current(name, old_version); !status.ok()) {
        cleanup.push_back("current symlink " + c_.artifacts->current_path(name).string() +
                          " should point at " + old_version);
      }
    }
    return fail("fetching artifact: " + fetched.error(), std::move(cleanup));
  }
  span.step("artifact", true, fetched.value().sha256);

  auto supervisor = c_.supervisor;
  if (auto status = supervisor->stop(name, request.cancel); !status.ok()) {
    std::vector<std::string> cleanup;
    if (auto restore = c_.artifacts->point_current(name, old_version); !restore.ok()) {
      cleanup.push_back("current symlink " + c_.artifacts->current_path(name).string() +
                        " should point at " + old_version);
    }
    return fail("stopping " + boundary.unit_name + ": " + status.error(), std::move(cleanup));
  }
  span.step("stop", true);

  // Puts the old version back and starts it. Returns the steps that could not be undone.
  auto restore_previous = [&]() {
    std::vector<std::string> failures;
    if (auto status = supervisor->stop(name, request.cancel); !status.ok()) {
      failures.push_back("stop " + boundary.unit_name + ": " + status.error());
    }
    if (auto status = c_.artifacts->point_current(name, old_version); !status.ok()) {
      failures.push_back("repoint to " + old_version + ": " + status.error());
    }
    if (auto status = supervisor->start(name, request.cancel); !status.ok()) {
      failures.push_back("start " + boundary.unit_name + " on " + old_version + ": " +
                         status.error());
    }
    observability::record_compensation(name, "restore_previous", failures.empty(),
                                       common::join(failures, "; "));
    return failures;
  };
  const std::vector<std::string> stopped_cleanup = {
      boundary.unit_name + " is stopped; current symlink should point at " + old_version};

  if (auto status = c_.artifacts->point_current(name, new_version); !status.ok()) {
    auto failures = restore_previous();
    auto cleanup = failures.empty() ? std::vector<std::string>{} : stopped_cleanup;
    return fail("switching to " + new_version + ": " + status.error(), std::move(cleanup),
                std::move(failures));
  }
  span.step("switch", true, new_version);

  std::string reason;
  if (auto status = supervisor->start(name, request.cancel); !status.ok()) {
    reason = "starting " + new_version + ": " + status.error();
  } else if (auto healthy = c_.health->wait_for_port(service.port, settings_.health_timeout,
                                                     request.cancel);
             !healthy.ok()) {
    reason = "health check on port " + std::to_string(service.port) + ": " + healthy.error();
  }

  if (!reason.empty()) {
    span.step("verify", false, reason);
    if (request.cancel.cancelled()) {
      return fail(reason + " (cancelled; previous version not restored)", stopped_cleanup);
    }
    auto failures = restore_previous();
    if (!failures.empty()) {
      return fail(reason, stopped_cleanup, std::move(failures));
    }
    result.to_version = old_version;
    result.rolled_back = true;
    result.reason = std::move(reason);
    span.finish("rolled_back");
    return WorkflowResult<UpgradeResult>::success(std::move(result));
  }
  span.step("verify", true, "port " + std::to_string(service.port));

  if (auto status = c_.artifacts->prune(name, {new_version, old_version}); !status.ok()) {
    result.warnings.push_back("pruning old artifacts: " + status.error());
  }

  service.previous_version = old_version;
  service.version = new_version;
  service.updated_at = now();
  auto updated = c_.store->update_service(service);
  if (!updated.ok() || !updated.value()) {
    const std::string cause = updated.ok() ? "record disappeared" : updated.error();
    return fail("recording state: " + cause,
                {"state record for " + name + " should show version " + new_version});
  }
  append_history(name, state::HistoryAction::Upgrade, new_version, {{"from", old_version}});

  span.finish("succeeded");
  return WorkflowResult<UpgradeResult>::success(std::move(result));
}

WorkflowResult<RollbackResult> Orchestrator::rollback(const RollbackRequest &request) {
  const std::string &name = request.name;
  WorkflowSpan span(ROLLBACK, name);

  auto loaded = load_existing(ROLLBACK, name);
  if (!loaded.ok()) {
    return span.fail<RollbackResult>(loaded.error());
  }
  state::Service service = loaded.value();
  if (!service.previous_version.has_value() || service.previous_version->empty()) {
    return span.fail<RollbackResult>(
        make_error(ErrorKind::Validation, ROLLBACK, name,
                   "service '" + name + "' has no previous version to roll back to"));
  }
  const std::string from = service.version;
  const std::string to = *service.previous_version;
  const auto boundary = isolation::derive_boundary(name);

  auto fail = [&](std::string message, std::vector<std::string> cleanup = {}) {
    WorkflowError error = make_error(ErrorKind::Dependency, ROLLBACK, name, std::move(message));
    error.manual_cleanup = std::move(cleanup);
    return span.fail<RollbackResult>(std::move(error));
  };

  auto supervisor = c_.supervisor;
  if (auto status = supervisor->stop(name, request.cancel); !status.ok()) {
    return fail("stopping " + boundary.unit_name + ": " + status.error());
  }
  span.step("stop", true);

  if (auto status = c_.artifacts->point_current(name, to); !status.ok()) {
    std::vector<std::string> cleanup;
    if (auto restart = supervisor->start(name, request.cancel); !restart.ok()) {
      cleanup.push_back(boundary.unit_name + " is stopped on " + from);
    }
    return fail("switching to " + to + ": " + status.error(), std::move(cleanup));
  }
  span.step("switch", true, to);

  if (auto status = supervisor->start(name, request.cancel); !status.ok()) {
    return fail("starting " + boundary.unit_name + " on " + to + ": " + status.error(),
                {boundary.unit_name + " is not running; current symlink points at " + to});
  }
  span.step("start", true);

  service.version = to;
  service.previous_version = from;
  service.updated_at = now();
  auto updated = c_.store->update_service(service);
  if (!updated.ok() || !updated.value()) {
    const std::string cause = updated.ok() ? "record disappeared" : updated.error();
    return fail("recording state: " + cause,
                {"state record for " + name + " should show version " + to});
  }
  append_history(name, state::HistoryAction::Rollback, to, {{"from", from}});

  RollbackResult result;
  result.name = name;
  result.from_version = from;
  result.to_version = to;
  span.finish("succeeded");
  return WorkflowResult<RollbackResult>::success(std::move(result));
}

WorkflowResult<RemoveResult> Orchestrator::remove(const RemoveRequest &request) {
  const std::string &name = request.name;
  WorkflowSpan span(REMOVE, name);

  auto loaded = load_existing(REMOVE, name);
  if (!loaded.ok()) {
    return span.fail<RemoveResult>(loaded.error());
  }
  const state::Service service = loaded.value();
  const auto boundary = isolation::derive_boundary(name);

  RemoveResult result;
  result.name = name;
  auto best_effort = [&](const std::string &step, const common::Status &status) {
    span.step(step, status.ok(), status.error());
    if (!status.ok()) {
      result.warnings.push_back(step + ": " + status.error());
    }
  };

  auto supervisor = c_.supervisor;
  best_effort("stop", supervisor->stop(name, request.cancel));
  best_effort("disable", supervisor->disable(name, request.cancel));
  best_effort("remove_unit", supervisor->remove_unit(name));
  best_effort("reload", supervisor->reload(request.cancel));
  best_effort("remove_account", supervisor->remove_account(name, request.cancel));
  if (!service.route.empty()) {
    best_effort("deactivate_route", c_.proxy->deactivate_route(name));
  }
  best_effort("remove_secrets", c_.credentials->remove_secrets(secrets_dir(name)));
  best_effort("remove_artifacts", c_.artifacts->remove_all(name));

  if (request.drop_database) {
    if (service.db_name.empty()) {
      result.warnings.push_back("service '" + name + "' has no database to drop");
    } else {
      if (auto status = c_.database->drop_database(name); !status.ok()) {
        span.step("drop_database", false, status.error());
        WorkflowError error = make_error(
            ErrorKind::Dependency, REMOVE, name,
            "dropping database " + service.db_name + ": " + status.error() +
                "; the service record was kept so removal can be retried");
        error.compensation_failures = result.warnings;
        error.manual_cleanup.push_back("database " + service.db_name + " and role " +
                                       service.db_user);
        return span.fail<RemoveResult>(std::move(error));
      }
      result.database_dropped = true;
      span.step("drop_database", true, service.db_name);
    }
  }

  auto deleted = c_.store->delete_service(name);
  if (!deleted.ok()) {
    return span.fail<RemoveResult>(make_error(ErrorKind::Dependency, REMOVE, name,
                                              "deleting state record: " + deleted.error()));
  }
  append_history(name, state::HistoryAction::Remove, service.version,
                 {{"database_dropped", result.database_dropped ? "true" : "false"}});

  span.finish(result.warnings.empty() ? "succeeded" : "succeeded_with_warnings");
  return WorkflowResult<RemoveResult>::success(std::move(result));
}

WorkflowResult<std::optional<state::Service>> Orchestrator::get_service(const std::string &name) {
  using GetResult = WorkflowResult<std::optional<state::Service>>;
  auto found = c_.store->get_service(name);
  if (!found.ok()) {
    return GetResult::failure(
        make_error(ErrorKind::Dependency, "get", name, "reading state: " + found.error()));
  }
  return GetResult::success(std::move(found.value()));
}

WorkflowResult<std::vector<state::Service>> Orchestrator::list_services() {
  using ListResult = WorkflowResult<std::vector<state::Service>>;
  auto services = c_.store->list_services();
  if (!services.ok()) {
    return ListResult::failure(
        make_error(ErrorKind::Dependency, "list", "", "reading state: " + services.error()));
  }
  return ListResult::success(std::move(services.value()));
}

WorkflowResult<ServiceStatus> Orchestrator::service_status(const std::string &name) {
  auto loaded = load_existing("status", name);
  if (!loaded.ok()) {
    return WorkflowResult<ServiceStatus>::failure(loaded.error());
  }
  ServiceStatus status;
  status.service = std::move(loaded.value());
  auto active = c_.supervisor->is_active(name);
  if (active.ok()) {
    status.active = active.value();
  } else {
    status.status_error = active.error();
  }
  return WorkflowResult<ServiceStatus>::success(std::move(status));
}

WorkflowResult<std::vector<state::HistoryEntry>>
Orchestrator::history(const std::string &name) {
  using HistoryResult = WorkflowResult<std::vector<state::HistoryEntry>>;
  auto entries = c_.store->list_history(name);
  if (!entries.ok()) {
    return HistoryResult::failure(
        make_error(ErrorKind::Dependency, "history", name, "reading history: " + entries.error()));
  }
  return HistoryResult::success(std::move(entries.value()));
}

} // namespace berth::orchestrator
