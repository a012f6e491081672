#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "clawwatch/daemon/daemon.hpp"
#include "clawwatch/daemon/pid_file.hpp"
#include "clawwatch/daemon/watchdog.hpp"
#include "clawwatch/state/store.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <thread>

namespace {

bool wait_for(const std::function<bool()> &condition, std::chrono::milliseconds limit) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (condition()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return condition();
}

} // namespace

void register_daemon_tests(std::vector<clawwatch::tests::TestCase> &tests) {
  using clawwatch::tests::require;
  namespace dm = clawwatch::daemon;
  namespace nt = clawwatch::notify;
  namespace st = clawwatch::state;
  namespace ct = clawwatch::testing;

  tests.push_back({"daemon_pid_file_prevents_double_start", [] {
                     ct::TempWorkspace workspace;
                     const auto pid_path = workspace.path() / "run" / "monitor.pid";

                     dm::PidFile first(pid_path);
                     auto acquired = first.acquire();
                     require(acquired.ok(), acquired.error());
                     require(std::filesystem::exists(pid_path), "pid file written");

                     dm::PidFile second(pid_path);
                     const auto blocked = second.acquire();
                     require(!blocked.ok(), "second controller must be refused");
                     require(blocked.error().find("another controller") != std::string::npos,
                             blocked.error());

                     first.release();
                     require(!std::filesystem::exists(pid_path), "release removes the file");
                     require(second.acquire().ok(), "free lock can be taken");
                   }});

  tests.push_back({"daemon_pid_file_takes_over_stale_lock", [] {
                     ct::TempWorkspace workspace;
                     // Highest pid Linux hands out is 2^22; this one cannot be alive.
                     workspace.create_file("monitor.pid", "999999999\n");
                     dm::PidFile lock(workspace.path() / "monitor.pid");
                     const auto acquired = lock.acquire();
                     require(acquired.ok(), acquired.error());
                     require(!dm::PidFile::is_process_running(999999999), "stale pid");
                   }});

  tests.push_back({"daemon_rescue_skipped_when_supervisor_healthy", [] {
                     auto config = ct::mock_config();
                     ct::FakeSupervisor supervisor;
                     supervisor.set_status("clawdbot-kakaotalk", "online");
                     ct::ChannelLog log;
                     nt::Notifier notifier;
                     notifier.add(std::make_unique<ct::RecordingChannel>("recording", log));

                     const auto rescue = dm::ensure_supervisor(config, supervisor, notifier, ct::no_sleep());
                     require(!rescue.rescued, "healthy supervisor needs no rescue");
                     require(log.size() == 0, "no notification");
                     require(supervisor.started().empty(), "nothing started");
                   }});

  tests.push_back({"daemon_rescue_bootstraps_ecosystems", [] {
                     ct::TempWorkspace workspace;
                     workspace.create_file("main/ecosystem.config.cjs", "module.exports = {}");
                     auto config = ct::mock_config();
                     config.ecosystems.emplace_back(
                         "main", (workspace.path() / "main" / "ecosystem.config.cjs").string());
                     config.ecosystems.emplace_back(
                         "monitor", (workspace.path() / "gone" / "ecosystem.config.cjs").string());
                     config.supervisor.bootstrap_settle_ms = 3000;

                     ct::FakeSupervisor supervisor;
                     supervisor.alive = false;
                     ct::ChannelLog log;
                     nt::Notifier notifier;
                     notifier.add(std::make_unique<ct::RecordingChannel>("recording", log));
                     std::chrono::milliseconds slept{0};
                     const clawwatch::common::Sleeper sleeper =
                         [&slept](std::chrono::milliseconds delay) { slept += delay; };

                     const auto rescue = dm::ensure_supervisor(config, supervisor, notifier, sleeper);
                     require(rescue.rescued, "dead supervisor must be rescued");
                     require(rescue.started.size() == 1 && rescue.skipped.size() == 1,
                             "existing descriptor started, missing one skipped");
                     const auto started = supervisor.started();
                     require(started.size() == 1 && started[0].second.empty(),
                             "whole descriptor started");
                     require(slept == std::chrono::milliseconds(3000), "settle after bootstrap");

                     const auto sent = log.snapshot();
                     require(sent.size() == 1, "one rescue notification");
                     require(sent[0].title == "Test Monitor RESCUE", sent[0].title);
                     require(sent[0].severity == nt::Severity::Critical, "rescue is critical");
                   }});

  tests.push_back({"daemon_rescue_on_empty_process_list", [] {
                     auto config = ct::mock_config();
                     ct::FakeSupervisor supervisor;
                     ct::ChannelLog log;
                     nt::Notifier notifier;
                     notifier.add(std::make_unique<ct::RecordingChannel>("recording", log));

                     const auto rescue = dm::ensure_supervisor(config, supervisor, notifier, ct::no_sleep());
                     require(rescue.rescued, "empty list triggers a rescue");
                     require(rescue.reason == "process list is empty", rescue.reason);
                   }});

  tests.push_back({"daemon_watchdog_runs_one_cycle_and_saves", [] {
                     ct::TempWorkspace workspace;
                     auto config = ct::monitor_config({"gateway", "bridge"});
                     config.lock_file = workspace.path() / "monitor.pid";
                     config.state_file = workspace.path() / "monitor-state.json";
                     ct::MonitorRig rig(config);
                     rig.probe("bridge").set_status(st::ServiceStatus::Fail);
                     ct::FakeSupervisor supervisor;
                     supervisor.set_status("gateway", "online");
                     const st::StateStore store(config.state_file);

                     const auto run = dm::run_watchdog(rig.config(), rig.monitor(), store, supervisor,
                                                       rig.notifier(), ct::no_sleep(),
                                                       rig.clock().clock());
                     require(run.ok(), run.error());
                     require(!run.value().rescue.rescued, "no rescue needed");
                     require(run.value().report.healthy(), "bridge was repaired");
                     require(!std::filesystem::exists(config.lock_file), "lock released");

                     const auto saved = store.load(rig.monitor().service_names());
                     require(saved.updated_at_ms == std::optional<std::int64_t>(rig.clock().now()),
                             "run time stamped");
                     require(saved.find("bridge")->status == st::ServiceStatus::Ok, "state saved");
                     require(saved.find("bridge")->last_notify_ms.has_value(),
                             "notification time persisted");
                   }});

  tests.push_back({"daemon_check_runs_keep_escalation_cooldown", [] {
                     ct::TempWorkspace workspace;
                     auto config = ct::monitor_config({"gateway"});
                     config.lock_file = workspace.path() / "monitor.pid";
                     config.state_file = workspace.path() / "monitor-state.json";
                     ct::MonitorRig rig(config);
                     rig.probe("gateway").set_status(st::ServiceStatus::Fail);
                     rig.repair("gateway").set_fixes(false);
                     rig.escalation_fails();
                     const st::StateStore store(config.state_file);

                     const auto first = dm::run_check_once(rig.config(), rig.monitor(), store,
                                                           rig.clock().clock());
                     require(first.ok(), first.error());
                     require(first.value().escalation == clawwatch::monitor::EscalationOutcome::StillFailed,
                             "first check escalates");
                     require(!std::filesystem::exists(config.lock_file), "lock released");
                     require(store.load({"gateway"}).escalation.attempt_count == 1,
                             "attempt persisted");

                     rig.clock().advance(std::chrono::seconds(60));
                     const auto second = dm::run_check_once(rig.config(), rig.monitor(), store,
                                                            rig.clock().clock());
                     require(second.ok(), second.error());
                     require(second.value().escalation ==
                                 clawwatch::monitor::EscalationOutcome::CooldownActive,
                             "second check is held back by the saved cooldown");
                     require(rig.runner().count("--repair") == 1, "script ran once");

                     rig.clock().advance(std::chrono::seconds(300));
                     const auto third = dm::run_check_once(rig.config(), rig.monitor(), store,
                                                           rig.clock().clock());
                     require(third.ok(), third.error());
                     require(rig.runner().count("--repair") == 2, "cooldown over, script reruns");
                     require(store.load({"gateway"}).escalation.attempt_count == 2,
                             "budget counted across runs");

                     dm::PidFile holder(config.lock_file);
                     require(holder.acquire().ok(), "holder lock");
                     require(!dm::run_check_once(rig.config(), rig.monitor(), store).ok(),
                             "check refuses while another controller runs");
                   }});

  tests.push_back({"daemon_watchdog_refuses_when_locked", [] {
                     ct::TempWorkspace workspace;
                     auto config = ct::monitor_config({"gateway"});
                     config.lock_file = workspace.path() / "monitor.pid";
                     ct::MonitorRig rig(config);
                     ct::FakeSupervisor supervisor;
                     const st::StateStore store(workspace.path() / "state.json");

                     dm::PidFile holder(config.lock_file);
                     require(holder.acquire().ok(), "holder lock");
                     const auto run = dm::run_watchdog(rig.config(), rig.monitor(), store, supervisor,
                                                       rig.notifier(), ct::no_sleep());
                     require(!run.ok(), "locked run must fail");
                     require(rig.probe("gateway").calls() == 0, "no probing while locked");
                     require(!std::filesystem::exists(workspace.path() / "state.json"),
                             "state untouched");
                   }});

  tests.push_back({"daemon_runs_cycles_until_stopped", [] {
                     ct::TempWorkspace workspace;
                     auto config = ct::monitor_config({"gateway"});
                     ct::MonitorRig rig(config);
                     const st::StateStore store(workspace.path() / "monitor-state.json");
                     dm::Daemon daemon(rig.config(), rig.monitor(), store, rig.clock().clock());

                     dm::DaemonOptions options;
                     options.interval = std::chrono::milliseconds(30);
                     options.lock_file = workspace.path() / "monitor.pid";
                     const auto started = daemon.start(options);
                     require(started.ok(), started.error());
                     require(daemon.is_running(), "daemon should run");
                     require(!daemon.start(options).ok(), "double start is rejected");

                     require(wait_for([&daemon] { return daemon.cycles_completed() >= 2; },
                                      std::chrono::seconds(5)),
                             "daemon should complete cycles");
                     daemon.stop();
                     require(!daemon.is_running(), "daemon stopped");
                     require(!std::filesystem::exists(options.lock_file), "lock released on stop");

                     const auto saved = store.load({"gateway"});
                     require(saved.updated_at_ms.has_value(), "state persisted between cycles");
                     require(saved.find("gateway")->status == st::ServiceStatus::Ok, "gateway ok");
                   }});

  tests.push_back({"daemon_rejects_bad_options_and_held_lock", [] {
                     ct::TempWorkspace workspace;
                     ct::MonitorRig rig(ct::monitor_config({"gateway"}));
                     const st::StateStore store(workspace.path() / "monitor-state.json");
                     dm::Daemon daemon(rig.config(), rig.monitor(), store, rig.clock().clock());

                     dm::DaemonOptions zero;
                     zero.interval = std::chrono::milliseconds(0);
                     require(!daemon.start(zero).ok(), "zero interval rejected");

                     dm::PidFile holder(workspace.path() / "monitor.pid");
                     require(holder.acquire().ok(), "holder lock");
                     dm::DaemonOptions locked;
                     locked.lock_file = workspace.path() / "monitor.pid";
                     require(!daemon.start(locked).ok(), "held lock rejected");
                     require(!daemon.is_running(), "daemon must not run");
                   }});
}
