#include "clawwatch/observability/global.hpp"

#include <mutex>

namespace clawwatch::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
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

void record_probe(const std::string &service, const std::string &status,
                  const std::string &detail) {
  record_event(ProbeEvent{.service = service, .status = status, .detail = detail});
}

void record_repair(const std::string &service, const bool success,
                   const std::chrono::milliseconds duration, const std::string &detail) {
  record_event(
      RepairEvent{.service = service, .success = success, .duration = duration, .detail = detail});
}

void record_escalation(const std::string &outcome, const std::uint32_t attempt_count,
                       const std::string &detail) {
  record_event(
      EscalationEvent{.outcome = outcome, .attempt_count = attempt_count, .detail = detail});
}

void record_rescue(const std::string &reason, const std::string &detail) {
  record_event(RescueEvent{.reason = reason, .detail = detail});
}

void record_notification(const std::string &channel, const std::string &title,
                         const bool delivered, const std::string &error) {
  record_event(NotificationEvent{
      .channel = channel, .title = title, .delivered = delivered, .error = error});
}

void record_cycle(const std::string &summary, const bool healthy,
                  const std::chrono::milliseconds duration, const std::uint64_t failed) {
  record_event(CycleEvent{.summary = summary, .healthy = healthy});
  record_metric(CycleDurationMetric{.duration = duration});
  record_metric(FailedServicesMetric{.count = failed});
}

void record_info(const std::string &component, const std::string &message) {
  record_event(InfoEvent{.component = component, .message = message});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace clawwatch::observability
