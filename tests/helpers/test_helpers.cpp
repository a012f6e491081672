#include "tests/helpers/test_helpers.hpp"

#include "clawwatch/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <random>
#include <stdexcept>

namespace clawwatch::testing {

config::Config mock_config() {
  config::Config config;
  config.notification.title = "Test Monitor";
  config.notification.desktop.enabled = false;
  config.observability.backend = "none";
  config.escalation.enabled = false;
  return config;
}

config::ServiceConfig service_config(const std::string &name, const config::ProbeKind probe) {
  config::ServiceConfig service;
  service.name = name;
  service.short_name = common::to_lower(name).substr(0, 2);
  std::transform(service.short_name.begin(), service.short_name.end(), service.short_name.begin(),
                 [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
  service.probe = probe;
  service.port = 18789;
  service.unit = name;
  service.process = name;
  service.settle_ms = 0;
  return service;
}

config::Config monitor_config(const std::vector<std::string> &names) {
  auto config = mock_config();
  for (const auto &name : names) {
    config.services.push_back(service_config(name));
  }
  config.notification.cooldown_secs = 300;
  config.escalation.enabled = true;
  config.escalation.script_path = "/opt/heal.sh";
  config.escalation.cooldown_secs = 300;
  config.escalation.max_retries = 2;
  return config;
}

common::Sleeper no_sleep() {
  return [](std::chrono::milliseconds) {};
}

process::CommandResult ok_result(std::string output) {
  return process::CommandResult{.ok = true, .exit_code = 0, .output = std::move(output)};
}

process::CommandResult fail_result(const int exit_code, std::string errors) {
  return process::CommandResult{.ok = false, .exit_code = exit_code, .errors = std::move(errors)};
}

void FakeCommandRunner::on(const std::string &pattern, process::CommandResult result,
                           std::function<void()> effect) {
  std::lock_guard<std::mutex> lock(mutex_);
  rules_.push_back(Rule{.pattern = pattern, .results = {std::move(result)},
                        .effect = std::move(effect)});
}

void FakeCommandRunner::on_sequence(const std::string &pattern,
                                    std::vector<process::CommandResult> results) {
  if (results.empty()) {
    throw std::invalid_argument("on_sequence needs at least one result");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  rules_.push_back(Rule{.pattern = pattern,
                        .results = std::deque<process::CommandResult>(results.begin(),
                                                                      results.end())});
}

process::CommandResult FakeCommandRunner::run(const std::string &command,
                                              const process::CommandOptions &options) {
  std::function<void()> effect;
  process::CommandResult result = ok_result();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    commands_.push_back(command);
    last_options_ = options;
    for (auto it = rules_.rbegin(); it != rules_.rend(); ++it) {
      if (command.find(it->pattern) == std::string::npos) {
        continue;
      }
      result = it->results.front();
      if (it->results.size() > 1) {
        it->results.pop_front();
      }
      effect = it->effect;
      break;
    }
  }
  if (effect) {
    effect();
  }
  return result;
}

std::vector<std::string> FakeCommandRunner::commands() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return commands_;
}

std::size_t FakeCommandRunner::count(const std::string &pattern) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return static_cast<std::size_t>(
      std::count_if(commands_.begin(), commands_.end(), [&pattern](const std::string &command) {
        return command.find(pattern) != std::string::npos;
      }));
}

std::optional<process::CommandOptions> FakeCommandRunner::last_options() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_options_;
}

void FakeHttpClient::set_get(const std::string &url, http::HttpResponse response) {
  std::lock_guard<std::mutex> lock(mutex_);
  gets_[url] = std::move(response);
}

void FakeHttpClient::set_post(http::HttpResponse response) {
  std::lock_guard<std::mutex> lock(mutex_);
  post_response_ = std::move(response);
}

http::HttpResponse FakeHttpClient::get(const std::string &url, std::uint64_t) {
  std::lock_guard<std::mutex> lock(mutex_);
  ++get_counts_[url];
  if (const auto it = gets_.find(url); it != gets_.end()) {
    return it->second;
  }
  return http_refused();
}

http::HttpResponse FakeHttpClient::post(const std::string &url, const http::Headers &headers,
                                        const std::string &body, const std::uint64_t timeout_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  posts_.push_back(PostCall{.url = url, .headers = headers, .body = body,
                            .timeout_ms = timeout_ms});
  return post_response_;
}

std::vector<PostCall> FakeHttpClient::posts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return posts_;
}

std::size_t FakeHttpClient::get_count(const std::string &url) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = get_counts_.find(url);
  return it == get_counts_.end() ? 0 : it->second;
}

http::HttpResponse http_status(const std::uint16_t status, std::string body) {
  return http::HttpResponse{.status = status, .body = std::move(body)};
}

http::HttpResponse http_refused() {
  return http::HttpResponse{.network_error = true,
                            .network_error_message = "Couldn't connect to server"};
}

void FakeSupervisor::set_status(const std::string &name, const std::string &status) {
  std::lock_guard<std::mutex> lock(mutex_);
  set_status_locked(name, status);
}

void FakeSupervisor::set_status_locked(const std::string &name, const std::string &status) {
  for (auto &info : processes) {
    if (info.name == name) {
      info.status = status;
      return;
    }
  }
  processes.push_back(supervisor::ProcessInfo{.name = name, .status = status});
}

bool FakeSupervisor::ping() { return alive; }

common::Result<std::vector<supervisor::ProcessInfo>> FakeSupervisor::list() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (list_error.has_value()) {
    return common::Result<std::vector<supervisor::ProcessInfo>>::failure(*list_error);
  }
  return common::Result<std::vector<supervisor::ProcessInfo>>::success(processes);
}

supervisor::RestartResult FakeSupervisor::restart(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  restarted_.push_back(name);
  if (restart_outcome == supervisor::RestartOutcome::Restarted && restart_brings_online) {
    set_status_locked(name, "online");
  }
  return supervisor::RestartResult{.outcome = restart_outcome,
                                   .detail = supervisor::to_string(restart_outcome)};
}

common::Status FakeSupervisor::start(const std::string &descriptor, const std::string &only) {
  std::lock_guard<std::mutex> lock(mutex_);
  started_.emplace_back(descriptor, only);
  if (start_error.has_value()) {
    return common::Status::error(*start_error);
  }
  if (!only.empty() && restart_brings_online) {
    set_status_locked(only, "online");
  }
  return common::Status::success();
}

std::vector<std::string> FakeSupervisor::restarted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return restarted_;
}

std::vector<std::pair<std::string, std::string>> FakeSupervisor::started() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return started_;
}

common::Result<std::string> FakeOsServiceControl::query_status(const std::string &unit) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = states.find(unit);
  if (it == states.end()) {
    return common::Result<std::string>::failure("unit " + unit + " not loaded");
  }
  return common::Result<std::string>::success(it->second);
}

common::Status FakeOsServiceControl::restart(const std::string &unit) {
  std::lock_guard<std::mutex> lock(mutex_);
  restarted_.push_back(unit);
  if (restart_error.has_value()) {
    return common::Status::error(*restart_error);
  }
  if (state_after_restart.has_value()) {
    states[unit] = *state_after_restart;
  }
  return common::Status::success();
}

std::vector<std::string> FakeOsServiceControl::restarted() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return restarted_;
}

std::optional<int> FakePortOwner::find_listener(std::uint16_t) {
  std::lock_guard<std::mutex> lock(mutex_);
  return listener;
}

common::Status FakePortOwner::terminate(const int pid) {
  std::lock_guard<std::mutex> lock(mutex_);
  terminated_.push_back(pid);
  if (listener == pid) {
    listener.reset();
  }
  return common::Status::success();
}

std::vector<int> FakePortOwner::terminated() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return terminated_;
}

std::vector<notify::Notification> ChannelLog::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex);
  return received;
}

std::size_t ChannelLog::size() const {
  std::lock_guard<std::mutex> lock(mutex);
  return received.size();
}

RecordingChannel::RecordingChannel(std::string name, ChannelLog &log, const Mode mode)
    : name_(std::move(name)), log_(log), mode_(mode) {}

common::Status RecordingChannel::send(const notify::Notification &notification) {
  if (mode_ == Mode::Throw) {
    throw std::runtime_error(name_ + " exploded");
  }
  {
    std::lock_guard<std::mutex> lock(log_.mutex);
    log_.received.push_back(notification);
  }
  if (mode_ == Mode::Fail) {
    return common::Status::error(name_ + " unavailable");
  }
  return common::Status::success();
}

ScriptedProbe::ScriptedProbe(config::ServiceConfig service, const state::ServiceStatus status)
    : Probe(std::move(service)), status_(status) {}

void ScriptedProbe::set_status(const state::ServiceStatus status) { status_ = status; }

probes::ProbeResult ScriptedProbe::run_check() {
  ++calls_;
  const auto status = status_.load();
  if (status == state::ServiceStatus::Ok) {
    return pass("scripted ok");
  }
  return fail("scripted failure");
}

ScriptedRepair::ScriptedRepair(config::ServiceConfig service, ScriptedProbe &probe,
                               const bool fixes)
    : RepairAction(std::move(service), probe, no_sleep()), scripted_(probe), fixes_(fixes) {}

repair::RepairResult ScriptedRepair::run_repair() {
  ++calls_;
  if (fixes_) {
    scripted_.set_status(state::ServiceStatus::Ok);
  }
  return settle_and_verify();
}

common::Clock ManualClock::clock() {
  return [this] { return now_.load(); };
}

void ManualClock::advance(const std::chrono::seconds delta) {
  now_ += std::chrono::duration_cast<std::chrono::milliseconds>(delta).count();
}

MonitorRig::MonitorRig(config::Config config) : config_(std::move(config)) {
  notifier_.add(std::make_unique<RecordingChannel>("recording", log_));

  std::vector<monitor::MonitoredService> services;
  for (const auto &service : config_.services) {
    auto probe = std::make_unique<ScriptedProbe>(service);
    auto repair = std::make_unique<ScriptedRepair>(service, *probe);
    probes_[service.name] = probe.get();
    repairs_[service.name] = repair.get();
    services.push_back(monitor::MonitoredService{
        .config = service, .probe = std::move(probe), .repair = std::move(repair)});
  }

  escalation_ = std::make_unique<monitor::EscalationController>(config_.escalation, runner_);
  monitor_ = std::make_unique<monitor::Monitor>(config_, std::move(services), notifier_,
                                                *escalation_, clock_.clock());
}

ScriptedProbe &MonitorRig::probe(const std::string &name) {
  const auto it = probes_.find(name);
  if (it == probes_.end()) {
    throw std::out_of_range("no probe for " + name);
  }
  return *it->second;
}

ScriptedRepair &MonitorRig::repair(const std::string &name) {
  const auto it = repairs_.find(name);
  if (it == repairs_.end()) {
    throw std::out_of_range("no repair for " + name);
  }
  return *it->second;
}

void MonitorRig::escalation_heals() {
  runner_.on("--repair", ok_result("healed"), [this] {
    for (auto &[name, probe] : probes_) {
      probe->set_status(state::ServiceStatus::Ok);
    }
  });
}

void MonitorRig::escalation_fails() { runner_.on("--repair", fail_result(1, "script failed")); }

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("clawwatch-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

} // namespace clawwatch::testing
