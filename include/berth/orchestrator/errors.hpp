#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace berth::orchestrator {

enum class ErrorKind {
  Validation,
  Conflict,
  Dependency,
  NotFound,
};

[[nodiscard]] const char *error_kind_to_string(ErrorKind kind);

struct WorkflowError {
  ErrorKind kind = ErrorKind::Dependency;
  std::string workflow;
  std::string service;
  std::string message;
  // Compensations that failed while undoing the workflow.
  std::vector<std::string> compensation_failures;
  // Resources that may still exist and need an operator.
  std::vector<std::string> manual_cleanup;

  [[nodiscard]] std::string to_string() const;
};

template <typename T> class WorkflowResult {
public:
  static WorkflowResult success(T value) { return WorkflowResult(std::move(value), std::nullopt); }
  static WorkflowResult failure(WorkflowError error) {
    return WorkflowResult(std::nullopt, std::move(error));
  }

  [[nodiscard]] bool ok() const { return value_.has_value(); }

  [[nodiscard]] const T &value() const {
    if (!value_.has_value()) {
      throw std::logic_error("WorkflowResult has no value: " + error_->message);
    }
    return *value_;
  }

  [[nodiscard]] T &value() {
    if (!value_.has_value()) {
      throw std::logic_error("WorkflowResult has no value: " + error_->message);
    }
    return *value_;
  }

  [[nodiscard]] const WorkflowError &error() const {
    if (!error_.has_value()) {
      throw std::logic_error("WorkflowResult holds a value, not an error");
    }
    return *error_;
  }

private:
  WorkflowResult(std::optional<T> value, std::optional<WorkflowError> error)
      : value_(std::move(value)), error_(std::move(error)) {}

  std::optional<T> value_;
  std::optional<WorkflowError> error_;
};

} // namespace berth::orchestrator
