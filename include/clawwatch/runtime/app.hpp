#pragma once

#include "clawwatch/common/result.hpp"
#include "clawwatch/config/schema.hpp"
#include "clawwatch/http/http_client.hpp"
#include "clawwatch/monitor/escalation.hpp"
#include "clawwatch/monitor/monitor.hpp"
#include "clawwatch/notify/notifier.hpp"
#include "clawwatch/probes/toolkit.hpp"
#include "clawwatch/process/command_runner.hpp"
#include "clawwatch/state/store.hpp"
#include "clawwatch/supervisor/os_service.hpp"
#include "clawwatch/supervisor/port_owner.hpp"
#include "clawwatch/supervisor/supervisor.hpp"

#include <memory>

namespace clawwatch::runtime {

/// Owns the resolved configuration and the concrete collaborators built from it. Everything
/// handed out by reference lives as long as the context.
class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;

  void install_observer() const;

  [[nodiscard]] process::CommandRunner &runner() { return *runner_; }
  [[nodiscard]] supervisor::ProcessSupervisor &supervisor() { return *supervisor_; }
  [[nodiscard]] notify::Notifier &notifier() { return *notifier_; }
  [[nodiscard]] monitor::EscalationController &escalation() { return *escalation_; }

  [[nodiscard]] probes::Toolkit toolkit();
  [[nodiscard]] std::unique_ptr<monitor::Monitor> create_monitor();
  [[nodiscard]] state::StateStore state_store() const;

private:
  config::Config config_;
  std::unique_ptr<process::ShellCommandRunner> runner_;
  std::unique_ptr<http::CurlHttpClient> http_;
  std::unique_ptr<supervisor::Pm2Supervisor> supervisor_;
  std::unique_ptr<supervisor::SystemdServiceControl> os_services_;
  std::unique_ptr<supervisor::LsofPortOwner> ports_;
  std::unique_ptr<notify::Notifier> notifier_;
  std::unique_ptr<monitor::EscalationController> escalation_;
};

} // namespace clawwatch::runtime
