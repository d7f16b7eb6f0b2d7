#pragma once

#include "berth/observability/observer.hpp"

#include <memory>

namespace berth::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_workflow_start(const std::string &workflow, const std::string &service);
void record_workflow_step(const std::string &workflow, const std::string &service,
                          const std::string &step, bool success, const std::string &detail = "");
void record_compensation(const std::string &service, const std::string &step, bool success,
                         const std::string &message = "");
void record_workflow_end(const std::string &workflow, const std::string &service,
                         const std::string &outcome, std::chrono::milliseconds duration);
void record_command(const std::string &command, int exit_code, std::chrono::milliseconds duration);
void record_error(const std::string &component, const std::string &message);

} // namespace berth::observability
