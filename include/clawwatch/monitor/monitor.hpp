#pragma once

#include "clawwatch/common/time.hpp"
#include "clawwatch/config/schema.hpp"
#include "clawwatch/monitor/escalation.hpp"
#include "clawwatch/notify/notifier.hpp"
#include "clawwatch/probes/probe.hpp"
#include "clawwatch/repair/repair.hpp"
#include "clawwatch/state/snapshot.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace clawwatch::monitor {

struct MonitoredService {
  config::ServiceConfig config;
  std::unique_ptr<probes::Probe> probe;
  std::unique_ptr<repair::RepairAction> repair;
};

[[nodiscard]] std::vector<MonitoredService> build_services(const config::Config &config,
                                                           probes::Toolkit &toolkit);

struct ServiceOutcome {
  std::string name;
  state::ServiceStatus status = state::ServiceStatus::Unknown;
  std::string detail;
  bool repaired = false;
};

struct CycleReport {
  // Configuration order.
  std::vector<ServiceOutcome> services;
  std::optional<EscalationOutcome> escalation;
  std::vector<notify::Notification> notifications;

  [[nodiscard]] bool healthy() const;
  [[nodiscard]] std::vector<std::string> failed() const;
  [[nodiscard]] state::ServiceStatus status_of(const std::string &name) const;
};

/// One check cycle: probe everything, repair what failed, escalate once if local repair was
/// not enough, and notify on transitions. The snapshot passed in is the only state it writes.
class Monitor {
public:
  Monitor(const config::Config &config, std::vector<MonitoredService> services,
          notify::Notifier &notifier, EscalationController &escalation,
          common::Clock clock = common::system_clock());

  [[nodiscard]] CycleReport run_cycle(state::Snapshot &snapshot);

  [[nodiscard]] std::vector<std::string> service_names() const;

private:
  [[nodiscard]] std::vector<probes::ProbeResult> probe_all();
  void send(state::ServiceRecord &record, notify::Notification notification, std::int64_t now,
            CycleReport &report);
  void send_all(const std::vector<std::string> &names, state::Snapshot &snapshot,
                notify::Notification notification, std::int64_t now, CycleReport &report);
  void handle_escalation(state::Snapshot &snapshot, std::int64_t now, CycleReport &report);

  [[nodiscard]] std::string display_name(const std::string &name) const;

  bool auto_repair_;
  config::NotificationConfig notification_;
  std::vector<MonitoredService> services_;
  notify::Notifier &notifier_;
  EscalationController &escalation_;
  common::Clock clock_;
};

} // namespace clawwatch::monitor
