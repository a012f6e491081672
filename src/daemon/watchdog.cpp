#include "clawwatch/daemon/watchdog.hpp"

#include "clawwatch/daemon/pid_file.hpp"
#include "clawwatch/monitor/summary.hpp"
#include "clawwatch/observability/global.hpp"

#include <filesystem>

namespace clawwatch::daemon {

namespace {

void bootstrap(const config::Config &config, supervisor::ProcessSupervisor &supervisor,
               const common::Sleeper &sleeper, RescueReport &rescue) {
  for (const auto &[label, path] : config.ecosystems) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      observability::record_warning("rescue", "skipping " + label + ": " + path + " not found");
      rescue.skipped.push_back(path);
      continue;
    }
    if (const auto status = supervisor.start(path, ""); !status.ok()) {
      observability::record_error("rescue", status.error());
      continue;
    }
    observability::record_info("rescue", "started " + label + " from " + path);
    rescue.started.push_back(path);
  }

  if (config.supervisor.bootstrap_settle_ms > 0 && sleeper) {
    sleeper(std::chrono::milliseconds(config.supervisor.bootstrap_settle_ms));
  }
}

void save_snapshot(const state::StateStore &store, state::Snapshot &snapshot,
                   const common::Clock &clock) {
  snapshot.updated_at_ms = clock();
  if (const auto saved = store.save(snapshot); !saved.ok()) {
    observability::record_error("state", "save failed: " + saved.error());
  }
}

} // namespace

RescueReport ensure_supervisor(const config::Config &config,
                               supervisor::ProcessSupervisor &supervisor,
                               notify::Notifier &notifier, const common::Sleeper &sleeper) {
  RescueReport rescue;
  std::string message;

  if (!supervisor.ping()) {
    rescue.reason = "supervisor daemon is not responding";
    message = "Supervisor dead - bootstrapping all services";
  } else {
    const auto processes = supervisor.list();
    if (!processes.ok() || processes.value().empty()) {
      rescue.reason = processes.ok() ? "process list is empty"
                                     : "process list unreadable: " + processes.error();
      message = "Supervisor process list empty - re-registering all services";
    }
  }

  if (rescue.reason.empty()) {
    return rescue;
  }

  rescue.rescued = true;
  observability::record_rescue(rescue.reason);
  (void)notifier.notify(notify::Notification{.title = config.notification.title + " RESCUE",
                                             .message = message,
                                             .severity = notify::Severity::Critical});
  bootstrap(config, supervisor, sleeper, rescue);
  return rescue;
}

common::Result<WatchdogRun> run_watchdog(const config::Config &config, monitor::Monitor &monitor,
                                         const state::StateStore &store,
                                         supervisor::ProcessSupervisor &supervisor,
                                         notify::Notifier &notifier,
                                         const common::Sleeper &sleeper,
                                         const common::Clock &clock) {
  PidFile lock(config.lock_file);
  if (auto status = lock.acquire(); !status.ok()) {
    return common::Result<WatchdogRun>::failure(status.error());
  }

  auto snapshot = store.load(monitor.service_names());

  WatchdogRun run;
  run.rescue = ensure_supervisor(config, supervisor, notifier, sleeper);
  run.report = monitor.run_cycle(snapshot);
  observability::record_info("status",
                             monitor::format_summary(config, run.report) + " | mode: watchdog");

  save_snapshot(store, snapshot, clock);
  return common::Result<WatchdogRun>::success(std::move(run));
}

common::Result<monitor::CycleReport> run_check_once(const config::Config &config,
                                                    monitor::Monitor &monitor,
                                                    const state::StateStore &store,
                                                    const common::Clock &clock) {
  PidFile lock(config.lock_file);
  if (auto status = lock.acquire(); !status.ok()) {
    return common::Result<monitor::CycleReport>::failure(status.error());
  }

  auto snapshot = store.load(monitor.service_names());
  auto report = monitor.run_cycle(snapshot);
  save_snapshot(store, snapshot, clock);
  return common::Result<monitor::CycleReport>::success(std::move(report));
}

} // namespace clawwatch::daemon
