#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "clawwatch/probes/probe.hpp"

#include <stdexcept>

namespace {

class ThrowingProbe final : public clawwatch::probes::Probe {
public:
  using Probe::Probe;

protected:
  [[nodiscard]] clawwatch::probes::ProbeResult run_check() override {
    throw std::runtime_error("socket exploded");
  }
};

} // namespace

void register_probe_tests(std::vector<clawwatch::tests::TestCase> &tests) {
  using clawwatch::tests::require;
  namespace pb = clawwatch::probes;
  namespace cfg = clawwatch::config;
  namespace st = clawwatch::state;
  namespace ct = clawwatch::testing;

  tests.push_back({"probe_http_any_status_below_threshold_is_alive", [] {
                     ct::FakeHttpClient http;
                     const auto service = ct::service_config("gateway");
                     pb::HttpProbe probe(service, http);
                     const std::string url = "http://127.0.0.1:18789/";

                     http.set_get(url, ct::http_status(200));
                     require(probe.check().ok(), "200 is alive");
                     http.set_get(url, ct::http_status(401));
                     require(probe.check().ok(), "401 still proves the process is up");
                     http.set_get(url, ct::http_status(302));
                     require(probe.check().ok(), "redirect is alive");
                     http.set_get(url, ct::http_status(503));
                     require(!probe.check().ok(), "5xx is down");
                   }});

  tests.push_back({"probe_http_threshold_is_per_service", [] {
                     ct::FakeHttpClient http;
                     auto strict = ct::service_config("gateway");
                     strict.alive_below = 400;
                     pb::HttpProbe probe(strict, http);
                     const std::string url = "http://127.0.0.1:18789/";

                     http.set_get(url, ct::http_status(399));
                     require(probe.check().ok(), "399 is below the threshold");
                     http.set_get(url, ct::http_status(400));
                     require(!probe.check().ok(), "threshold itself is down");
                     http.set_get(url, ct::http_status(401));
                     const auto unauthorized = probe.check();
                     require(unauthorized.status == st::ServiceStatus::Fail,
                             "401 is down when alive_below is 400");
                     require(unauthorized.detail.find("401") != std::string::npos,
                             unauthorized.detail);
                   }});

  tests.push_back({"probe_http_network_failure_is_down", [] {
                     ct::FakeHttpClient http;
                     pb::HttpProbe probe(ct::service_config("gateway"), http);
                     const auto result = probe.check();
                     require(result.status == st::ServiceStatus::Fail, "refused is down");
                     require(result.detail.find("connect") != std::string::npos, result.detail);

                     http.set_get("http://127.0.0.1:18789/",
                                  clawwatch::http::HttpResponse{.timeout = true,
                                                                .network_error = true,
                                                                .network_error_message = "timeout"});
                     const auto timed_out = probe.check();
                     require(!timed_out.ok(), "timeout is down");
                     require(timed_out.detail == "timed out", timed_out.detail);
                   }});

  tests.push_back({"probe_http_uses_explicit_url", [] {
                     ct::FakeHttpClient http;
                     auto service = ct::service_config("gateway");
                     service.probe_url = "http://10.0.0.2:9000/healthz";
                     http.set_get(service.probe_url, ct::http_status(204));
                     pb::HttpProbe probe(service, http);
                     require(probe.check().ok(), "explicit url should be probed");
                     require(http.get_count("http://127.0.0.1:18789/") == 0, "port url unused");
                   }});

  tests.push_back({"probe_disabled_skips_io", [] {
                     ct::FakeHttpClient http;
                     auto service = ct::service_config("gateway");
                     service.enabled = false;
                     pb::HttpProbe probe(service, http);
                     require(probe.check().status == st::ServiceStatus::Disabled, "disabled status");
                     require(http.get_count("http://127.0.0.1:18789/") == 0, "no request made");
                   }});

  tests.push_back({"probe_exception_becomes_failure", [] {
                     ThrowingProbe probe(ct::service_config("gateway"));
                     const auto result = probe.check();
                     require(result.status == st::ServiceStatus::Fail, "throw means down");
                     require(result.detail.find("socket exploded") != std::string::npos,
                             result.detail);
                   }});

  tests.push_back({"probe_supervisor_requires_online_process", [] {
                     ct::FakeSupervisor supervisor;
                     ct::FakeHttpClient http;
                     pb::SupervisorProbe probe(
                         ct::service_config("clawdbot-kakaotalk", cfg::ProbeKind::Supervisor),
                         supervisor, http);

                     require(!probe.check().ok(), "unregistered process is down");
                     supervisor.set_status("clawdbot-kakaotalk", "errored");
                     const auto errored = probe.check();
                     require(!errored.ok(), "errored process is down");
                     require(errored.detail.find("errored") != std::string::npos, errored.detail);
                     supervisor.set_status("clawdbot-kakaotalk", "online");
                     require(probe.check().ok(), "online process is up");

                     supervisor.list_error = "jlist timed out";
                     require(!probe.check().ok(), "unreadable list is down");
                   }});

  tests.push_back({"probe_supervisor_ping_body_must_match", [] {
                     ct::FakeSupervisor supervisor;
                     supervisor.set_status("memento-bridge", "online");
                     ct::FakeHttpClient http;
                     auto service = ct::service_config("memento-bridge", cfg::ProbeKind::Supervisor);
                     service.ping_url = "http://127.0.0.1:3200/ping";
                     service.expect_body = "pong";
                     pb::SupervisorProbe probe(service, supervisor, http);

                     require(!probe.check().ok(), "online but ping refused is down");
                     http.set_get(service.ping_url, ct::http_status(200, "nope"));
                     require(!probe.check().ok(), "wrong body is down");
                     http.set_get(service.ping_url, ct::http_status(200, "pong\n"));
                     require(probe.check().ok(), "pong is up");
                   }});

  tests.push_back({"probe_os_service_state_and_verify", [] {
                     ct::FakeOsServiceControl os_services;
                     ct::FakeCommandRunner runner;
                     auto service = ct::service_config("cloudflared", cfg::ProbeKind::OsService);
                     service.verify_command = "cloudflared tunnel info openclaw";
                     service.verify_contains = "CONNECTOR";
                     service.verify_rejects = "does not have any active connection";
                     pb::OsServiceProbe probe(service, os_services, runner);

                     require(!probe.check().ok(), "unknown unit is down");
                     os_services.states["cloudflared"] = "inactive";
                     require(!probe.check().ok(), "inactive is down");

                     os_services.states["cloudflared"] = "active";
                     runner.on("tunnel info", ct::ok_result("CONNECTOR ID  CREATED  EDGE"));
                     require(probe.check().ok(), "active and connected is up");

                     runner.on("tunnel info",
                               ct::ok_result("CONNECTOR: tunnel does not have any active connection"));
                     require(!probe.check().ok(), "rejected phrase wins over the expected one");

                     runner.on("tunnel info", ct::ok_result("no connectors"));
                     require(!probe.check().ok(), "missing expected phrase is down");

                     runner.on("tunnel info", ct::fail_result(1));
                     require(!probe.check().ok(), "failing verify command is down");
                   }});

  tests.push_back({"probe_factory_matches_kind", [] {
                     ct::FakeCommandRunner runner;
                     ct::FakeHttpClient http;
                     ct::FakeSupervisor supervisor;
                     ct::FakeOsServiceControl os_services;
                     ct::FakePortOwner ports;
                     pb::Toolkit toolkit{.runner = runner, .http = http, .supervisor = supervisor,
                                         .os_services = os_services, .ports = ports,
                                         .sleeper = ct::no_sleep()};

                     auto http_probe = pb::create_probe(ct::service_config("a"), toolkit);
                     require(dynamic_cast<pb::HttpProbe *>(http_probe.get()) != nullptr, "http");
                     auto pm2_probe = pb::create_probe(
                         ct::service_config("b", cfg::ProbeKind::Supervisor), toolkit);
                     require(dynamic_cast<pb::SupervisorProbe *>(pm2_probe.get()) != nullptr,
                             "supervisor");
                     auto os_probe = pb::create_probe(
                         ct::service_config("c", cfg::ProbeKind::OsService), toolkit);
                     require(dynamic_cast<pb::OsServiceProbe *>(os_probe.get()) != nullptr,
                             "os service");
                   }});
}
