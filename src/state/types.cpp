#include "berth/state/types.hpp"

namespace berth::state {

std::string route_type_to_string(const RouteType type) {
  switch (type) {
  case RouteType::None:
    return "";
  case RouteType::Subdomain:
    return "subdomain";
  case RouteType::Path:
    return "path";
  }
  return "";
}

std::optional<RouteType> route_type_from_string(const std::string &value) {
  if (value.empty() || value == "none") {
    return RouteType::None;
  }
  if (value == "subdomain") {
    return RouteType::Subdomain;
  }
  if (value == "path") {
    return RouteType::Path;
  }
  return std::nullopt;
}

std::string history_action_to_string(const HistoryAction action) {
  switch (action) {
  case HistoryAction::Deploy:
    return "deploy";
  case HistoryAction::Upgrade:
    return "upgrade";
  case HistoryAction::Rollback:
    return "rollback";
  case HistoryAction::Remove:
    return "remove";
  }
  return "unknown";
}

} // namespace berth::state
