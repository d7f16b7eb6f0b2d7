#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace berth::state {

enum class RouteType {
  None,
  Subdomain,
  Path,
};

[[nodiscard]] std::string route_type_to_string(RouteType type);
[[nodiscard]] std::optional<RouteType> route_type_from_string(const std::string &value);

struct Route {
  RouteType type = RouteType::None;
  std::string value;

  [[nodiscard]] bool empty() const { return type == RouteType::None; }
};

using EnvMap = std::map<std::string, std::string>;

struct Service {
  std::string name;
  std::string repo;
  std::string version;
  // Set only once an upgrade or rollback has happened.
  std::optional<std::string> previous_version;
  int port = 0;
  Route route;
  std::string db_name;
  std::string db_user;
  EnvMap extra_env;
  std::int64_t deployed_at = 0;
  std::int64_t updated_at = 0;
};

enum class HistoryAction {
  Deploy,
  Upgrade,
  Rollback,
  Remove,
};

[[nodiscard]] std::string history_action_to_string(HistoryAction action);

struct HistoryEntry {
  std::int64_t id = 0;
  std::string service;
  std::string action;
  std::string version;
  std::int64_t timestamp = 0;
  EnvMap detail;
};

} // namespace berth::state
