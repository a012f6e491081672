#include "clawwatch/monitor/monitor.hpp"

#include "clawwatch/monitor/cooldown.hpp"
#include "clawwatch/observability/global.hpp"

#include <future>

namespace clawwatch::monitor {

using state::ServiceStatus;

std::vector<MonitoredService> build_services(const config::Config &config,
                                             probes::Toolkit &toolkit) {
  std::vector<MonitoredService> services;
  services.reserve(config.services.size());
  for (const auto &service : config.services) {
    MonitoredService monitored{.config = service, .probe = probes::create_probe(service, toolkit)};
    monitored.repair = repair::create_repair(service, config, *monitored.probe, toolkit);
    services.push_back(std::move(monitored));
  }
  return services;
}

bool CycleReport::healthy() const {
  for (const auto &service : services) {
    if (service.status != ServiceStatus::Ok && service.status != ServiceStatus::Disabled) {
      return false;
    }
  }
  return true;
}

std::vector<std::string> CycleReport::failed() const {
  std::vector<std::string> out;
  for (const auto &service : services) {
    if (service.status == ServiceStatus::Fail) {
      out.push_back(service.name);
    }
  }
  return out;
}

ServiceStatus CycleReport::status_of(const std::string &name) const {
  for (const auto &service : services) {
    if (service.name == name) {
      return service.status;
    }
  }
  return ServiceStatus::Unknown;
}

Monitor::Monitor(const config::Config &config, std::vector<MonitoredService> services,
                 notify::Notifier &notifier, EscalationController &escalation,
                 common::Clock clock)
    : auto_repair_(config.auto_repair), notification_(config.notification),
      services_(std::move(services)), notifier_(notifier), escalation_(escalation),
      clock_(std::move(clock)) {}

std::vector<std::string> Monitor::service_names() const {
  std::vector<std::string> names;
  names.reserve(services_.size());
  for (const auto &service : services_) {
    names.push_back(service.config.name);
  }
  return names;
}

std::string Monitor::display_name(const std::string &name) const {
  for (const auto &service : services_) {
    if (service.config.name == name) {
      return service.config.display_name();
    }
  }
  return name;
}

std::vector<probes::ProbeResult> Monitor::probe_all() {
  std::vector<std::future<probes::ProbeResult>> pending;
  pending.reserve(services_.size());
  for (auto &service : services_) {
    pending.push_back(std::async(std::launch::async,
                                 [&service]() { return service.probe->check(); }));
  }

  std::vector<probes::ProbeResult> results;
  results.reserve(pending.size());
  for (auto &future : pending) {
    results.push_back(future.get());
  }
  return results;
}

void Monitor::send(state::ServiceRecord &record, notify::Notification notification,
                   const std::int64_t now, CycleReport &report) {
  // Stamped before sending, whatever the channels report.
  record.last_notify_ms = now;
  (void)notifier_.notify(notification);
  report.notifications.push_back(std::move(notification));
}

void Monitor::send_all(const std::vector<std::string> &names, state::Snapshot &snapshot,
                       notify::Notification notification, const std::int64_t now,
                       CycleReport &report) {
  for (const auto &name : names) {
    snapshot.record(name).last_notify_ms = now;
  }
  (void)notifier_.notify(notification);
  report.notifications.push_back(std::move(notification));
}

CycleReport Monitor::run_cycle(state::Snapshot &snapshot) {
  const auto started = std::chrono::steady_clock::now();
  const std::int64_t now = clock_();
  CycleReport report;

  const auto probed = probe_all();

  // Repairs only touch their own service, so they run side by side.
  std::vector<std::optional<std::future<repair::RepairResult>>> pending(services_.size());
  if (auto_repair_) {
    for (std::size_t i = 0; i < services_.size(); ++i) {
      if (probed[i].status == ServiceStatus::Fail && services_[i].repair != nullptr) {
        auto *action = services_[i].repair.get();
        pending[i] = std::async(std::launch::async, [action]() { return action->repair(); });
      }
    }
  }

  bool needs_escalation = false;
  for (std::size_t i = 0; i < services_.size(); ++i) {
    const auto &service = services_[i].config;
    auto &record = snapshot.record(service.name);
    const ServiceStatus previous = record.status;
    ServiceOutcome outcome{.name = service.name, .status = probed[i].status,
                           .detail = probed[i].detail};

    if (probed[i].status == ServiceStatus::Disabled) {
      record.status = ServiceStatus::Disabled;
    } else if (probed[i].status == ServiceStatus::Ok) {
      record.status = ServiceStatus::Ok;
      if (previous == ServiceStatus::Fail && notification_.on_recover &&
          should_notify(record, now, notification_.cooldown_secs)) {
        send(record,
             notify::Notification{.title = notification_.title,
                                  .message = service.display_name() + " is back online"},
             now, report);
      }
    } else {
      std::optional<repair::RepairResult> repaired;
      if (pending[i].has_value()) {
        repaired = pending[i]->get();
      }

      if (repaired.has_value() && repaired->ok) {
        outcome.status = ServiceStatus::Ok;
        outcome.repaired = true;
        outcome.detail = repaired->detail;
        record.status = ServiceStatus::Ok;
        if (should_notify(record, now, notification_.cooldown_secs)) {
          send(record,
               notify::Notification{.title = notification_.title,
                                    .message = service.display_name() + " down -> auto-repaired"},
               now, report);
        }
      } else {
        if (repaired.has_value()) {
          outcome.detail = repaired->detail;
        }
        if (previous != ServiceStatus::Fail || !record.last_failure_ms.has_value()) {
          record.last_failure_ms = now;
        }
        record.status = ServiceStatus::Fail;
        outcome.status = ServiceStatus::Fail;
        needs_escalation = true;
      }
    }

    report.services.push_back(std::move(outcome));
  }

  if (needs_escalation) {
    handle_escalation(snapshot, now, report);
  }

  if (report.healthy()) {
    snapshot.escalation.attempt_count = 0;
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_cycle(report.healthy() ? "cycle healthy" : "cycle degraded",
                              report.healthy(), elapsed, report.failed().size());
  return report;
}

void Monitor::handle_escalation(state::Snapshot &snapshot, const std::int64_t now,
                                CycleReport &report) {
  const auto outcome = escalation_.escalate(snapshot.escalation, now);
  report.escalation = outcome;

  if (outcome == EscalationOutcome::Recovered) {
    const auto reprobed = probe_all();
    for (std::size_t i = 0; i < services_.size(); ++i) {
      const auto &name = services_[i].config.name;
      auto &record = snapshot.record(name);
      auto &entry = report.services[i];
      const bool was_failed = entry.status == ServiceStatus::Fail;

      entry.status = reprobed[i].status;
      entry.detail = reprobed[i].detail;
      record.status = reprobed[i].status;
      if (reprobed[i].status == ServiceStatus::Fail &&
          (!was_failed || !record.last_failure_ms.has_value())) {
        record.last_failure_ms = now;
      }

      if (was_failed && reprobed[i].status == ServiceStatus::Ok) {
        send(record,
             notify::Notification{.title = notification_.title,
                                  .message = services_[i].config.display_name() +
                                             " recovered after escalation repair"},
             now, report);
      }
    }
  }

  // After a recovered escalation this is whatever the re-probe still found down.
  const auto still_failed = report.failed();
  if (still_failed.empty()) {
    return;
  }

  bool due = false;
  for (const auto &name : still_failed) {
    if (should_notify(snapshot.record(name), now, notification_.cooldown_secs)) {
      due = true;
      break;
    }
  }
  if (!due) {
    return;
  }

  std::string names;
  for (const auto &name : still_failed) {
    if (!names.empty()) {
      names += ", ";
    }
    names += display_name(name);
  }

  std::string reason;
  switch (outcome) {
  case EscalationOutcome::Disabled:
    reason = "Repair failed";
    break;
  case EscalationOutcome::CooldownActive:
    reason = "Repair failed, escalation cooling down";
    break;
  case EscalationOutcome::BudgetExhausted:
    reason = "Repair failed, escalation budget exhausted";
    break;
  case EscalationOutcome::StillFailed:
    reason = "Repair+Escalation failed";
    break;
  case EscalationOutcome::Recovered:
    reason = "Still down after escalation repair";
    break;
  }

  send_all(still_failed, snapshot,
           notify::Notification{.title = notification_.title + " CRITICAL",
                                .message = reason + ": " + names,
                                .severity = notify::Severity::Critical},
           now, report);
}

} // namespace clawwatch::monitor
