#pragma once

#include "clawwatch/common/time.hpp"
#include "clawwatch/http/http_client.hpp"
#include "clawwatch/process/command_runner.hpp"
#include "clawwatch/supervisor/os_service.hpp"
#include "clawwatch/supervisor/port_owner.hpp"
#include "clawwatch/supervisor/supervisor.hpp"

namespace clawwatch::probes {

/// Collaborators shared by every probe and repair action. The owner outlives them all.
struct Toolkit {
  process::CommandRunner &runner;
  http::HttpClient &http;
  supervisor::ProcessSupervisor &supervisor;
  supervisor::OsServiceControl &os_services;
  supervisor::PortOwner &ports;
  common::Sleeper sleeper;
};

} // namespace clawwatch::probes
