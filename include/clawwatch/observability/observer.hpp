#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace clawwatch::observability {

struct ProbeEvent {
  std::string service;
  std::string status;
  std::string detail;
};

struct RepairEvent {
  std::string service;
  bool success = false;
  std::chrono::milliseconds duration{0};
  std::string detail;
};

struct EscalationEvent {
  std::string outcome;
  std::uint32_t attempt_count = 0;
  std::string detail;
};

struct RescueEvent {
  std::string reason;
  std::string detail;
};

struct NotificationEvent {
  std::string channel;
  std::string title;
  bool delivered = false;
  std::string error;
};

struct CycleEvent {
  std::string summary;
  bool healthy = false;
};

struct InfoEvent {
  std::string component;
  std::string message;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ProbeEvent, RepairEvent, EscalationEvent, RescueEvent, NotificationEvent,
                 CycleEvent, InfoEvent, WarningEvent, ErrorEvent>;

struct CycleDurationMetric {
  std::chrono::milliseconds duration{0};
};

struct FailedServicesMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<CycleDurationMetric, FailedServicesMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace clawwatch::observability
