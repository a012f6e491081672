#include "clawwatch/repair/repair.hpp"

#include "clawwatch/observability/global.hpp"

#include <algorithm>
#include <chrono>

namespace clawwatch::repair {

namespace {

constexpr auto kRepairCommandTimeout = std::chrono::seconds(60);

} // namespace

RepairAction::RepairAction(config::ServiceConfig service, probes::Probe &probe,
                           common::Sleeper sleeper)
    : service_(std::move(service)), probe_(probe), sleeper_(std::move(sleeper)) {}

RepairResult RepairAction::repair() {
  if (!service_.enabled) {
    return RepairResult{.ok = false, .detail = "service is disabled"};
  }

  const auto started = std::chrono::steady_clock::now();
  RepairResult result;
  try {
    if (probe_.check().ok()) {
      result = RepairResult{.ok = true, .detail = "already healthy"};
    } else {
      result = run_repair();
    }
  } catch (const std::exception &e) {
    result = RepairResult{.ok = false, .detail = std::string("repair threw: ") + e.what()};
  }

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_repair(service_.name, result.ok, elapsed, result.detail);
  return result;
}

RepairResult RepairAction::settle_and_verify() {
  if (service_.settle_ms > 0 && sleeper_) {
    sleeper_(std::chrono::milliseconds(service_.settle_ms));
  }
  const auto probe = probe_.check();
  return RepairResult{.ok = probe.ok(), .detail = probe.detail};
}

SupervisorRepair::SupervisorRepair(config::ServiceConfig service, probes::Probe &probe,
                                   common::Sleeper sleeper,
                                   supervisor::ProcessSupervisor &supervisor,
                                   supervisor::PortOwner &ports,
                                   std::optional<std::string> descriptor)
    : RepairAction(std::move(service), probe, std::move(sleeper)), supervisor_(supervisor),
      ports_(ports), descriptor_(std::move(descriptor)) {}

void SupervisorRepair::free_port() {
  if (service_.port == 0) {
    return;
  }
  const auto pid = ports_.find_listener(service_.port);
  if (!pid.has_value()) {
    return;
  }
  if (const auto status = ports_.terminate(*pid); !status.ok()) {
    observability::record_warning(service_.name, status.error());
    return;
  }
  observability::record_info(service_.name, "killed stale pid " + std::to_string(*pid) +
                                                 " on port " + std::to_string(service_.port));
}

RepairResult SupervisorRepair::run_repair() {
  free_port();

  const auto restarted = supervisor_.restart(service_.process);
  if (restarted.outcome != supervisor::RestartOutcome::Restarted) {
    observability::record_warning(service_.name, "restart " +
                                                     supervisor::to_string(restarted.outcome) +
                                                     ", starting from descriptor");
    if (!descriptor_.has_value()) {
      observability::record_error(service_.name,
                                  "cannot recover: no ecosystem descriptor for " +
                                      service_.process);
      return RepairResult{.ok = false, .detail = "no ecosystem descriptor"};
    }
    if (const auto started = supervisor_.start(*descriptor_, service_.process); !started.ok()) {
      return RepairResult{.ok = false, .detail = started.error()};
    }
  }

  return settle_and_verify();
}

OsServiceRepair::OsServiceRepair(config::ServiceConfig service, probes::Probe &probe,
                                 common::Sleeper sleeper,
                                 supervisor::OsServiceControl &os_services)
    : RepairAction(std::move(service), probe, std::move(sleeper)), os_services_(os_services) {}

RepairResult OsServiceRepair::run_repair() {
  if (const auto status = os_services_.restart(service_.unit); !status.ok()) {
    return RepairResult{.ok = false, .detail = status.error()};
  }
  return settle_and_verify();
}

CommandRepair::CommandRepair(config::ServiceConfig service, probes::Probe &probe,
                             common::Sleeper sleeper, process::CommandRunner &runner)
    : RepairAction(std::move(service), probe, std::move(sleeper)), runner_(runner) {}

RepairResult CommandRepair::run_repair() {
  process::CommandOptions options;
  options.timeout = kRepairCommandTimeout;

  auto result = runner_.run(service_.repair_command, options);
  if (!result.ok && !service_.fallback_command.empty()) {
    observability::record_warning(service_.name, "repair command failed, trying fallback");
    result = runner_.run(service_.fallback_command, options);
  }
  if (!result.ok) {
    // The service may still come up on its own; the probe has the final say.
    observability::record_warning(service_.name, "repair command failed: " + result.combined());
  }

  const std::uint32_t attempts = std::max<std::uint32_t>(1, service_.repair_attempts);
  RepairResult verified;
  for (std::uint32_t attempt = 0; attempt < attempts; ++attempt) {
    verified = settle_and_verify();
    if (verified.ok) {
      return verified;
    }
  }
  verified.detail = "still down after " + std::to_string(attempts) + " checks";
  return verified;
}

RepairResult NoRepair::run_repair() { return settle_and_verify(); }

std::unique_ptr<RepairAction> create_repair(const config::ServiceConfig &service,
                                            const config::Config &config, probes::Probe &probe,
                                            probes::Toolkit &toolkit) {
  switch (service.repair) {
  case config::RepairKind::Supervisor:
    return std::make_unique<SupervisorRepair>(service, probe, toolkit.sleeper, toolkit.supervisor,
                                              toolkit.ports,
                                              config.ecosystem_path(service.ecosystem));
  case config::RepairKind::OsService:
    return std::make_unique<OsServiceRepair>(service, probe, toolkit.sleeper,
                                             toolkit.os_services);
  case config::RepairKind::Command:
    return std::make_unique<CommandRepair>(service, probe, toolkit.sleeper, toolkit.runner);
  case config::RepairKind::None:
    break;
  }
  return std::make_unique<NoRepair>(service, probe, toolkit.sleeper);
}

} // namespace clawwatch::repair
