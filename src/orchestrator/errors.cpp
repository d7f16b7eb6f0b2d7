#include "berth/orchestrator/errors.hpp"

namespace berth::orchestrator {

const char *error_kind_to_string(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Validation:
    return "validation";
  case ErrorKind::Conflict:
    return "conflict";
  case ErrorKind::Dependency:
    return "dependency";
  case ErrorKind::NotFound:
    return "not_found";
  }
  return "unknown";
}

std::string WorkflowError::to_string() const {
  std::string out = workflow + " " + service + ": " + message;
  for (const auto &failure : compensation_failures) {
    out += "\n  rollback failed: " + failure;
  }
  if (!manual_cleanup.empty()) {
    out += "\n  manual cleanup needed:";
    for (const auto &resource : manual_cleanup) {
      out += "\n    - " + resource;
    }
  }
  return out;
}

} // namespace berth::orchestrator
