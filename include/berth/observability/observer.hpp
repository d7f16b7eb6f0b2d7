#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <variant>

namespace berth::observability {

struct WorkflowStartEvent {
  std::string workflow;
  std::string service;
};

struct WorkflowStepEvent {
  std::string workflow;
  std::string service;
  std::string step;
  bool success = false;
  std::string detail;
};

struct CompensationEvent {
  std::string service;
  std::string step;
  bool success = false;
  std::string message;
};

struct WorkflowEndEvent {
  std::string workflow;
  std::string service;
  std::string outcome;
  std::chrono::milliseconds duration{0};
};

struct CommandEvent {
  std::string command;
  int exit_code = 0;
  std::chrono::milliseconds duration{0};
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<WorkflowStartEvent, WorkflowStepEvent, CompensationEvent,
                                   WorkflowEndEvent, CommandEvent, ErrorEvent>;

struct WorkflowLatencyMetric {
  std::string workflow;
  std::chrono::milliseconds latency{0};
};

using ObserverMetric = std::variant<WorkflowLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace berth::observability
