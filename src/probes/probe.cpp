#include "clawwatch/probes/probe.hpp"

#include "clawwatch/common/fs.hpp"
#include "clawwatch/observability/global.hpp"

#include <algorithm>
#include <chrono>

namespace clawwatch::probes {

namespace {

std::string describe(const http::HttpResponse &response) {
  if (response.timeout) {
    return "timed out";
  }
  if (response.network_error) {
    return response.network_error_message;
  }
  return "HTTP " + std::to_string(response.status);
}

} // namespace

Probe::Probe(config::ServiceConfig service) : service_(std::move(service)) {}

ProbeResult Probe::check() {
  if (!service_.enabled) {
    return ProbeResult{.status = state::ServiceStatus::Disabled, .detail = "disabled"};
  }

  ProbeResult result;
  try {
    result = run_check();
  } catch (const std::exception &e) {
    result = fail(std::string("probe threw: ") + e.what());
  }
  observability::record_probe(service_.name, state::to_string(result.status), result.detail);
  return result;
}

ProbeResult Probe::pass(std::string detail) {
  return ProbeResult{.status = state::ServiceStatus::Ok, .detail = std::move(detail)};
}

ProbeResult Probe::fail(std::string detail) {
  return ProbeResult{.status = state::ServiceStatus::Fail, .detail = std::move(detail)};
}

HttpProbe::HttpProbe(config::ServiceConfig service, http::HttpClient &http)
    : Probe(std::move(service)), http_(http) {}

ProbeResult HttpProbe::run_check() {
  const auto response = http_.get(probe_url(service_), service_.timeout_ms);
  if (response.responded() && response.status < service_.alive_below) {
    return pass(describe(response));
  }
  return fail(describe(response));
}

SupervisorProbe::SupervisorProbe(config::ServiceConfig service,
                                 supervisor::ProcessSupervisor &supervisor, http::HttpClient &http)
    : Probe(std::move(service)), supervisor_(supervisor), http_(http) {}

ProbeResult SupervisorProbe::run_check() {
  const auto processes = supervisor_.list();
  if (!processes.ok()) {
    return fail(processes.error());
  }

  const auto &list = processes.value();
  const auto it = std::find_if(list.begin(), list.end(), [this](const auto &info) {
    return info.name == service_.process;
  });
  if (it == list.end()) {
    return fail(service_.process + " is not registered");
  }
  if (!it->online()) {
    return fail(service_.process + " is " + (it->status.empty() ? "unknown" : it->status));
  }

  if (service_.ping_url.empty()) {
    return pass(service_.process + " online");
  }

  const auto response = http_.get(service_.ping_url, service_.timeout_ms);
  if (!service_.expect_body.empty()) {
    if (response.responded() && common::trim(response.body) == service_.expect_body) {
      return pass("ping answered " + service_.expect_body);
    }
    return fail("ping: " + (response.responded() ? "unexpected body" : describe(response)));
  }
  if (response.responded() && response.status < service_.alive_below) {
    return pass("ping " + describe(response));
  }
  return fail("ping " + describe(response));
}

OsServiceProbe::OsServiceProbe(config::ServiceConfig service,
                               supervisor::OsServiceControl &os_services,
                               process::CommandRunner &runner)
    : Probe(std::move(service)), os_services_(os_services), runner_(runner) {}

ProbeResult OsServiceProbe::run_check() {
  const auto status = os_services_.query_status(service_.unit);
  if (!status.ok()) {
    return fail(status.error());
  }
  if (common::to_lower(status.value()) != common::to_lower(service_.expect_state)) {
    return fail(service_.unit + " is " + status.value());
  }

  if (service_.verify_command.empty()) {
    return pass(service_.unit + " " + status.value());
  }

  process::CommandOptions options;
  options.timeout = std::chrono::milliseconds(service_.timeout_ms);
  const auto verify = runner_.run(service_.verify_command, options);
  if (!verify.ok) {
    return fail("verify command failed" + (verify.timed_out ? std::string(" (timeout)") : ""));
  }
  const std::string text = verify.combined();
  if (!service_.verify_rejects.empty() && text.find(service_.verify_rejects) != std::string::npos) {
    return fail("verify output reports: " + service_.verify_rejects);
  }
  if (!service_.verify_contains.empty() &&
      text.find(service_.verify_contains) == std::string::npos) {
    return fail("verify output lacks: " + service_.verify_contains);
  }
  return pass(service_.unit + " connected");
}

std::string probe_url(const config::ServiceConfig &service) {
  if (!service.probe_url.empty()) {
    return service.probe_url;
  }
  return "http://127.0.0.1:" + std::to_string(service.port) + "/";
}

std::unique_ptr<Probe> create_probe(const config::ServiceConfig &service, Toolkit &toolkit) {
  switch (service.probe) {
  case config::ProbeKind::Http:
    return std::make_unique<HttpProbe>(service, toolkit.http);
  case config::ProbeKind::Supervisor:
    return std::make_unique<SupervisorProbe>(service, toolkit.supervisor, toolkit.http);
  case config::ProbeKind::OsService:
    return std::make_unique<OsServiceProbe>(service, toolkit.os_services, toolkit.runner);
  }
  return std::make_unique<HttpProbe>(service, toolkit.http);
}

} // namespace clawwatch::probes
