#pragma once

#include "clawwatch/config/schema.hpp"
#include "clawwatch/probes/toolkit.hpp"
#include "clawwatch/state/snapshot.hpp"

#include <memory>
#include <string>

namespace clawwatch::probes {

struct ProbeResult {
  state::ServiceStatus status = state::ServiceStatus::Fail;
  std::string detail;

  [[nodiscard]] bool ok() const { return status == state::ServiceStatus::Ok; }
};

/// One bounded liveness check for one service. Probes never write stored state.
class Probe {
public:
  explicit Probe(config::ServiceConfig service);
  virtual ~Probe() = default;

  /// Disabled services short-circuit before any I/O. Exceptions become Fail.
  [[nodiscard]] ProbeResult check();

  [[nodiscard]] const config::ServiceConfig &service() const { return service_; }

protected:
  [[nodiscard]] virtual ProbeResult run_check() = 0;

  [[nodiscard]] static ProbeResult pass(std::string detail = "");
  [[nodiscard]] static ProbeResult fail(std::string detail);

  config::ServiceConfig service_;
};

/// Alive iff any response arrives with a status below the service's `alive_below`.
class HttpProbe final : public Probe {
public:
  HttpProbe(config::ServiceConfig service, http::HttpClient &http);

protected:
  [[nodiscard]] ProbeResult run_check() override;

private:
  http::HttpClient &http_;
};

class SupervisorProbe final : public Probe {
public:
  SupervisorProbe(config::ServiceConfig service, supervisor::ProcessSupervisor &supervisor,
                  http::HttpClient &http);

protected:
  [[nodiscard]] ProbeResult run_check() override;

private:
  supervisor::ProcessSupervisor &supervisor_;
  http::HttpClient &http_;
};

class OsServiceProbe final : public Probe {
public:
  OsServiceProbe(config::ServiceConfig service, supervisor::OsServiceControl &os_services,
                 process::CommandRunner &runner);

protected:
  [[nodiscard]] ProbeResult run_check() override;

private:
  supervisor::OsServiceControl &os_services_;
  process::CommandRunner &runner_;
};

[[nodiscard]] std::string probe_url(const config::ServiceConfig &service);

[[nodiscard]] std::unique_ptr<Probe> create_probe(const config::ServiceConfig &service,
                                                  Toolkit &toolkit);

} // namespace clawwatch::probes
