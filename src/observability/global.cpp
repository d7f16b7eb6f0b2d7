#include "berth/observability/global.hpp"

#include <mutex>

namespace berth::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_workflow_start(const std::string &workflow, const std::string &service) {
  record_event(WorkflowStartEvent{.workflow = workflow, .service = service});
}

void record_workflow_step(const std::string &workflow, const std::string &service,
                          const std::string &step, const bool success, const std::string &detail) {
  record_event(WorkflowStepEvent{
      .workflow = workflow, .service = service, .step = step, .success = success, .detail = detail});
}

void record_compensation(const std::string &service, const std::string &step, const bool success,
                         const std::string &message) {
  record_event(
      CompensationEvent{.service = service, .step = step, .success = success, .message = message});
}

void record_workflow_end(const std::string &workflow, const std::string &service,
                         const std::string &outcome, const std::chrono::milliseconds duration) {
  record_event(WorkflowEndEvent{
      .workflow = workflow, .service = service, .outcome = outcome, .duration = duration});
  record_metric(WorkflowLatencyMetric{.workflow = workflow, .latency = duration});
}

void record_command(const std::string &command, const int exit_code,
                    const std::chrono::milliseconds duration) {
  record_event(CommandEvent{.command = command, .exit_code = exit_code, .duration = duration});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace berth::observability
