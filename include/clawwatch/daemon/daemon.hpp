#pragma once

#include "clawwatch/common/result.hpp"
#include "clawwatch/common/time.hpp"
#include "clawwatch/config/schema.hpp"
#include "clawwatch/daemon/pid_file.hpp"
#include "clawwatch/monitor/monitor.hpp"
#include "clawwatch/state/store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <thread>

namespace clawwatch::daemon {

struct DaemonOptions {
  std::chrono::milliseconds interval{std::chrono::seconds(60)};
  std::filesystem::path lock_file;
};

/// Continuous mode: one cycle per interval on a background thread. Each cycle's state is saved
/// before the next one starts, so cycles never overlap.
class Daemon {
public:
  Daemon(const config::Config &config, monitor::Monitor &monitor, const state::StateStore &store,
         common::Clock clock = common::system_clock());
  ~Daemon();

  Daemon(const Daemon &) = delete;
  Daemon &operator=(const Daemon &) = delete;

  [[nodiscard]] common::Status start(const DaemonOptions &options);
  void stop();
  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::uint64_t cycles_completed() const { return cycles_.load(); }

private:
  void run_loop(DaemonOptions options);
  void run_one_cycle(const DaemonOptions &options);

  const config::Config &config_;
  monitor::Monitor &monitor_;
  const state::StateStore &store_;
  common::Clock clock_;
  state::Snapshot snapshot_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> cycles_{0};
  std::unique_ptr<PidFile> lock_;
  std::thread thread_;
};

} // namespace clawwatch::daemon
