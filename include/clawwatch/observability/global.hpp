#pragma once

#include "clawwatch/observability/observer.hpp"

#include <memory>

namespace clawwatch::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_probe(const std::string &service, const std::string &status,
                  const std::string &detail = "");
void record_repair(const std::string &service, bool success, std::chrono::milliseconds duration,
                   const std::string &detail = "");
void record_escalation(const std::string &outcome, std::uint32_t attempt_count,
                       const std::string &detail = "");
void record_rescue(const std::string &reason, const std::string &detail = "");
void record_notification(const std::string &channel, const std::string &title, bool delivered,
                         const std::string &error = "");
void record_cycle(const std::string &summary, bool healthy, std::chrono::milliseconds duration,
                  std::uint64_t failed);
void record_info(const std::string &component, const std::string &message);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace clawwatch::observability
