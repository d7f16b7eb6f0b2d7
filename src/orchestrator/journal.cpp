#include "berth/orchestrator/journal.hpp"

#include "berth/observability/global.hpp"

#include <utility>

namespace berth::orchestrator {

const char *step_kind_to_string(const StepKind kind) {
  switch (kind) {
  case StepKind::Artifact:
    return "artifact";
  case StepKind::Database:
    return "database";
  case StepKind::Secrets:
    return "secrets";
  case StepKind::Account:
    return "account";
  case StepKind::Unit:
    return "unit";
  case StepKind::Route:
    return "route";
  }
  return "unknown";
}

RollbackJournal::RollbackJournal(std::string service) : service_(std::move(service)) {}

void RollbackJournal::record(const StepKind kind, std::string resource,
                             std::function<common::Status()> compensate) {
  entries_.push_back(JournalEntry{kind, std::move(resource), std::move(compensate)});
}

bool RollbackJournal::contains(const StepKind kind) const {
  for (const auto &entry : entries_) {
    if (entry.kind == kind) {
      return true;
    }
  }
  return false;
}

UnwindReport RollbackJournal::unwind() {
  UnwindReport report;
  for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
    const std::string step = step_kind_to_string(it->kind);
    common::Status status = it->compensate ? it->compensate() : common::Status::success();
    observability::record_compensation(service_, step, status.ok(), status.error());
    if (!status.ok()) {
      report.failures.push_back("undo " + step + ": " + status.error());
      report.manual_cleanup.push_back(it->resource);
    }
  }
  entries_.clear();
  return report;
}

std::vector<std::string> RollbackJournal::outstanding() const {
  std::vector<std::string> resources;
  for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
    resources.push_back(it->resource);
  }
  return resources;
}

} // namespace berth::orchestrator
