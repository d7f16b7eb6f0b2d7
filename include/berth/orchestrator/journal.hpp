#pragma once

#include "berth/common/result.hpp"

#include <functional>
#include <string>
#include <vector>

namespace berth::orchestrator {

enum class StepKind {
  Artifact,
  Database,
  Secrets,
  Account,
  Unit,
  Route,
};

[[nodiscard]] const char *step_kind_to_string(StepKind kind);

/// A completed forward step and the action that undoes it. The compensation captures
/// identifiers only; `resource` names what is left behind if it cannot run.
struct JournalEntry {
  StepKind kind = StepKind::Artifact;
  std::string resource;
  std::function<common::Status()> compensate;
};

struct UnwindReport {
  std::vector<std::string> failures;
  std::vector<std::string> manual_cleanup;

  [[nodiscard]] bool clean() const { return failures.empty(); }
};

/// Append-only list of completed steps for one workflow run.
class RollbackJournal {
public:
  explicit RollbackJournal(std::string service);

  void record(StepKind kind, std::string resource, std::function<common::Status()> compensate);

  [[nodiscard]] bool empty() const { return entries_.empty(); }
  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] bool contains(StepKind kind) const;
  [[nodiscard]] const std::vector<JournalEntry> &entries() const { return entries_; }

  /// Runs every compensation newest first. A failing compensation does not stop the rest.
  [[nodiscard]] UnwindReport unwind();

  /// The resources of every recorded step, newest first, without running anything.
  [[nodiscard]] std::vector<std::string> outstanding() const;

private:
  std::string service_;
  std::vector<JournalEntry> entries_;
};

} // namespace berth::orchestrator
