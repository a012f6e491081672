#include "clawwatch/runtime/app.hpp"

#include "clawwatch/config/config.hpp"
#include "clawwatch/observability/factory.hpp"
#include "clawwatch/observability/global.hpp"

namespace clawwatch::runtime {

RuntimeContext::RuntimeContext(config::Config config)
    : config_(std::move(config)), runner_(std::make_unique<process::ShellCommandRunner>()),
      http_(std::make_unique<http::CurlHttpClient>()) {
  supervisor_ = std::make_unique<supervisor::Pm2Supervisor>(*runner_, config_.supervisor);
  os_services_ = std::make_unique<supervisor::SystemdServiceControl>(*runner_, config_.os_service);
  ports_ = std::make_unique<supervisor::LsofPortOwner>(*runner_);
  notifier_ = notify::create_notifier(config_.notification, *runner_, *http_);
  escalation_ = std::make_unique<monitor::EscalationController>(config_.escalation, *runner_);
}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.error());
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

void RuntimeContext::install_observer() const {
  observability::set_global_observer(observability::create_observer(config_.observability));
}

probes::Toolkit RuntimeContext::toolkit() {
  return probes::Toolkit{.runner = *runner_,
                         .http = *http_,
                         .supervisor = *supervisor_,
                         .os_services = *os_services_,
                         .ports = *ports_,
                         .sleeper = common::thread_sleeper()};
}

std::unique_ptr<monitor::Monitor> RuntimeContext::create_monitor() {
  auto tools = toolkit();
  return std::make_unique<monitor::Monitor>(config_, monitor::build_services(config_, tools),
                                            *notifier_, *escalation_);
}

state::StateStore RuntimeContext::state_store() const { return state::StateStore(config_.state_file); }

} // namespace clawwatch::runtime
