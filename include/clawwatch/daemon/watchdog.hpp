#pragma once

#include "clawwatch/common/result.hpp"
#include "clawwatch/common/time.hpp"
#include "clawwatch/config/schema.hpp"
#include "clawwatch/monitor/monitor.hpp"
#include "clawwatch/notify/notifier.hpp"
#include "clawwatch/state/store.hpp"
#include "clawwatch/supervisor/supervisor.hpp"

#include <string>

namespace clawwatch::daemon {

struct RescueReport {
  bool rescued = false;
  std::string reason;
  // Descriptors that were started, and those skipped because they do not exist.
  std::vector<std::string> started;
  std::vector<std::string> skipped;
};

/// Make sure the supervisor is alive and knows about its processes. When it does not answer,
/// or answers with an empty process list, every configured ecosystem descriptor is started.
RescueReport ensure_supervisor(const config::Config &config,
                               supervisor::ProcessSupervisor &supervisor,
                               notify::Notifier &notifier, const common::Sleeper &sleeper);

struct WatchdogRun {
  RescueReport rescue;
  monitor::CycleReport report;
};

/// `check` mode: lock, load state, run one cycle, save state. Saving keeps the escalation
/// cooldown and budget in force across back-to-back one-shot runs.
[[nodiscard]] common::Result<monitor::CycleReport>
run_check_once(const config::Config &config, monitor::Monitor &monitor,
               const state::StateStore &store,
               const common::Clock &clock = common::system_clock());

/// One stateless run for an external scheduler: lock, load state, rescue the supervisor if
/// needed, run one cycle, save state. Fails only when another controller holds the lock.
[[nodiscard]] common::Result<WatchdogRun>
run_watchdog(const config::Config &config, monitor::Monitor &monitor,
             const state::StateStore &store, supervisor::ProcessSupervisor &supervisor,
             notify::Notifier &notifier, const common::Sleeper &sleeper,
             const common::Clock &clock = common::system_clock());

} // namespace clawwatch::daemon
