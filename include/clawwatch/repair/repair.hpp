#pragma once

#include "clawwatch/config/schema.hpp"
#include "clawwatch/probes/probe.hpp"

#include <memory>
#include <optional>
#include <string>

namespace clawwatch::repair {

struct RepairResult {
  bool ok = false;
  std::string detail;
};

/// Service-scoped recovery routine. Safe to call repeatedly: a service whose probe already
/// passes is left untouched.
class RepairAction {
public:
  RepairAction(config::ServiceConfig service, probes::Probe &probe, common::Sleeper sleeper);
  virtual ~RepairAction() = default;

  /// Never throws; failures of the underlying commands come back as `ok = false`.
  [[nodiscard]] RepairResult repair();

  [[nodiscard]] const config::ServiceConfig &service() const { return service_; }

protected:
  [[nodiscard]] virtual RepairResult run_repair() = 0;

  [[nodiscard]] RepairResult settle_and_verify();

  config::ServiceConfig service_;
  probes::Probe &probe_;
  common::Sleeper sleeper_;
};

/// Frees the service's port, restarts the process through the supervisor and falls back to
/// starting it from its ecosystem descriptor when the supervisor does not know it.
class SupervisorRepair final : public RepairAction {
public:
  SupervisorRepair(config::ServiceConfig service, probes::Probe &probe, common::Sleeper sleeper,
                   supervisor::ProcessSupervisor &supervisor, supervisor::PortOwner &ports,
                   std::optional<std::string> descriptor);

protected:
  [[nodiscard]] RepairResult run_repair() override;

private:
  void free_port();

  supervisor::ProcessSupervisor &supervisor_;
  supervisor::PortOwner &ports_;
  std::optional<std::string> descriptor_;
};

class OsServiceRepair final : public RepairAction {
public:
  OsServiceRepair(config::ServiceConfig service, probes::Probe &probe, common::Sleeper sleeper,
                  supervisor::OsServiceControl &os_services);

protected:
  [[nodiscard]] RepairResult run_repair() override;

private:
  supervisor::OsServiceControl &os_services_;
};

/// Runs `repair_command` (or `fallback_command` if it fails), then polls the probe up to
/// `repair_attempts` times.
class CommandRepair final : public RepairAction {
public:
  CommandRepair(config::ServiceConfig service, probes::Probe &probe, common::Sleeper sleeper,
                process::CommandRunner &runner);

protected:
  [[nodiscard]] RepairResult run_repair() override;

private:
  process::CommandRunner &runner_;
};

class NoRepair final : public RepairAction {
public:
  using RepairAction::RepairAction;

protected:
  [[nodiscard]] RepairResult run_repair() override;
};

[[nodiscard]] std::unique_ptr<RepairAction> create_repair(const config::ServiceConfig &service,
                                                          const config::Config &config,
                                                          probes::Probe &probe,
                                                          probes::Toolkit &toolkit);

} // namespace clawwatch::repair
