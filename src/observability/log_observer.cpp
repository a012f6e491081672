#include "clawwatch/observability/log_observer.hpp"

#include "clawwatch/common/time.hpp"

#include <iostream>
#include <type_traits>

namespace clawwatch::observability {

namespace {

std::string with_detail(std::string message, const std::string &detail) {
  if (!detail.empty()) {
    message += " (" + detail + ")";
  }
  return message;
}

} // namespace

LogObserver::LogObserver() : out_(std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(out) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  std::string padded(level);
  padded.resize(6, ' ');
  const std::string line =
      "[" + common::format_clock_time(common::now_ms()) + "] " + padded + "| " + message + "\n";

  std::lock_guard<std::mutex> lock(mutex_);
  out_ << line;
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ProbeEvent>) {
          log_line(evt.status == "fail" ? "WARN" : "INFO",
                   with_detail("[" + evt.service + "] probe " + evt.status, evt.detail));
        } else if constexpr (std::is_same_v<T, RepairEvent>) {
          log_line(evt.success ? "INFO" : "WARN",
                   with_detail("[" + evt.service + "] repair " +
                                   (evt.success ? std::string("succeeded") : std::string("failed")) +
                                   " in " + std::to_string(evt.duration.count()) + "ms",
                               evt.detail));
        } else if constexpr (std::is_same_v<T, EscalationEvent>) {
          log_line("WARN", with_detail("escalation " + evt.outcome + " attempts=" +
                                           std::to_string(evt.attempt_count),
                                       evt.detail));
        } else if constexpr (std::is_same_v<T, RescueEvent>) {
          log_line("WARN", with_detail("supervisor rescue: " + evt.reason, evt.detail));
        } else if constexpr (std::is_same_v<T, NotificationEvent>) {
          if (evt.delivered) {
            log_line("INFO", "notify." + evt.channel + " sent: " + evt.title);
          } else {
            log_line("WARN", with_detail("notify." + evt.channel + " failed: " + evt.title, evt.error));
          }
        } else if constexpr (std::is_same_v<T, CycleEvent>) {
          log_line(evt.healthy ? "INFO" : "WARN", evt.summary);
        } else if constexpr (std::is_same_v<T, InfoEvent>) {
          log_line("INFO", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
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
        if constexpr (std::is_same_v<T, CycleDurationMetric>) {
          log_line("DEBUG", "metric.cycle_duration_ms=" + std::to_string(m.duration.count()));
        } else if constexpr (std::is_same_v<T, FailedServicesMetric>) {
          log_line("DEBUG", "metric.failed_services=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace clawwatch::observability
