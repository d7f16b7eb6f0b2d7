#include "berth/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace berth::observability {

namespace {

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::log_line(const std::string &level, const std::string &message) {
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, WorkflowStartEvent>) {
          log_line("INFO", evt.workflow + ".start service=" + evt.service);
        } else if constexpr (std::is_same_v<T, WorkflowStepEvent>) {
          std::string line = evt.workflow + ".step service=" + evt.service + " step=" + evt.step +
                             " success=" + bool_text(evt.success);
          if (!evt.detail.empty()) {
            line += " " + evt.detail;
          }
          log_line(evt.success ? "INFO" : "WARN", line);
        } else if constexpr (std::is_same_v<T, CompensationEvent>) {
          std::string line = "compensate service=" + evt.service + " step=" + evt.step +
                             " success=" + bool_text(evt.success);
          if (!evt.message.empty()) {
            line += " " + evt.message;
          }
          log_line(evt.success ? "INFO" : "ERROR", line);
        } else if constexpr (std::is_same_v<T, WorkflowEndEvent>) {
          log_line("INFO", evt.workflow + ".end service=" + evt.service +
                               " outcome=" + evt.outcome +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, CommandEvent>) {
          log_line("DEBUG", "exec " + evt.command + " exit=" + std::to_string(evt.exit_code) +
                                " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, WorkflowLatencyMetric>) {
          log_line("DEBUG",
                   "metric." + m.workflow + "_latency_ms=" + std::to_string(m.latency.count()));
        }
      },
      metric);
}

void LogObserver::flush() { out_.flush(); }

} // namespace berth::observability
