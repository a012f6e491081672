#include "clawwatch/daemon/daemon.hpp"

#include "clawwatch/daemon/pid_file.hpp"
#include "clawwatch/monitor/summary.hpp"
#include "clawwatch/observability/global.hpp"

#include <iostream>
#include <system_error>

namespace clawwatch::daemon {

Daemon::Daemon(const config::Config &config, monitor::Monitor &monitor,
               const state::StateStore &store, common::Clock clock)
    : config_(config), monitor_(monitor), store_(store), clock_(std::move(clock)) {}

Daemon::~Daemon() { stop(); }

common::Status Daemon::start(const DaemonOptions &options) {
  if (running_) {
    return common::Status::error("daemon already running");
  }
  if (options.interval.count() <= 0) {
    return common::Status::error("interval must be positive");
  }

  if (!options.lock_file.empty()) {
    lock_ = std::make_unique<PidFile>(options.lock_file);
    if (auto status = lock_->acquire(); !status.ok()) {
      lock_.reset();
      return status;
    }
  }

  snapshot_ = store_.load(monitor_.service_names());
  running_ = true;
  thread_ = std::thread([this, options]() { run_loop(options); });
  return common::Status::success();
}

void Daemon::run_loop(const DaemonOptions options) {
  while (running_) {
    run_one_cycle(options);

    const auto deadline = std::chrono::steady_clock::now() + options.interval;
    while (running_ && std::chrono::steady_clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  }
}

void Daemon::run_one_cycle(const DaemonOptions &options) {
  try {
    const auto report = monitor_.run_cycle(snapshot_);
    snapshot_.updated_at_ms = clock_();
    if (const auto saved = store_.save(snapshot_); !saved.ok()) {
      observability::record_error("state", "save failed: " + saved.error());
    }
    const auto next =
        std::chrono::duration_cast<std::chrono::seconds>(options.interval).count();
    observability::record_info("status", monitor::format_summary(config_, report) +
                                             " | next: " + std::to_string(next) + "s");
  } catch (const std::exception &e) {
    observability::record_error("daemon", std::string("check cycle failed: ") + e.what());
  }
  ++cycles_;
}

void Daemon::stop() {
  running_ = false;
  if (thread_.joinable()) {
    try {
      thread_.join();
    } catch (const std::system_error &err) {
      std::cerr << "[daemon] thread join failed: " << err.what() << "\n";
    }
  }
  if (lock_ != nullptr) {
    lock_->release();
    lock_.reset();
  }
}

bool Daemon::is_running() const { return running_; }

} // namespace clawwatch::daemon
