#include "clawwatch/cli/commands.hpp"

#include "clawwatch/common/fs.hpp"
#include "clawwatch/common/time.hpp"
#include "clawwatch/config/config.hpp"
#include "clawwatch/daemon/daemon.hpp"
#include "clawwatch/daemon/watchdog.hpp"
#include "clawwatch/monitor/summary.hpp"
#include "clawwatch/observability/global.hpp"
#include "clawwatch/runtime/app.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace clawwatch::cli {

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) { g_stop_requested = 1; }

std::string version_string() {
#ifdef CLAWWATCH_VERSION
  std::string version = CLAWWATCH_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "clawwatch " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config" || args[i] == "-c") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

// Loads the configuration and installs the logger. Any failure here is fatal for every verb.
common::Result<runtime::RuntimeContext> open_context() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    return context;
  }
  context.value().install_observer();

  const auto warnings = config::validate_config(context.value().config());
  if (warnings.ok()) {
    for (const auto &warning : warnings.value()) {
      observability::record_warning("config", warning);
    }
  }
  observability::record_info("config", "loaded " +
                                           context.value().config().source_path.string());
  return context;
}

int run_check() {
  auto context = open_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto &ctx = context.value();
  const auto &cfg = ctx.config();

  observability::record_info("check", "Running one-shot health check...");
  auto monitor = ctx.create_monitor();
  const auto store = ctx.state_store();
  const auto checked = daemon::run_check_once(cfg, *monitor, store);
  if (!checked.ok()) {
    std::cerr << checked.error() << "\n";
    return 1;
  }
  const auto &report = checked.value();

  std::cout << "\n" << monitor::format_summary(cfg, report) << "\n";
  if (!cfg.routes.empty()) {
    std::cout << "\n--- Route Status ---\n";
    for (const auto &route : monitor::evaluate_routes(cfg, report)) {
      std::cout << monitor::format_route(route) << "\n";
    }
  }
  std::cout << "\n" << (report.healthy() ? "ALL SERVICES HEALTHY" : "SOME SERVICES UNHEALTHY")
            << "\n";
  return report.healthy() ? 0 : 1;
}

int run_daemon(std::vector<std::string> args) {
  std::string duration_raw;
  (void)take_option(args, "--duration-secs", "", duration_raw);

  auto context = open_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto &ctx = context.value();
  const auto &cfg = ctx.config();

  observability::record_info("daemon", "Starting monitoring (interval: " +
                                           std::to_string(cfg.interval_secs) + "s, repair: " +
                                           (cfg.auto_repair ? "on" : "off") + ")");
  if (cfg.escalation.enabled) {
    observability::record_info("daemon", "Escalation: enabled (cooldown: " +
                                             std::to_string(cfg.escalation.cooldown_secs) +
                                             "s, max_retries: " +
                                             std::to_string(cfg.escalation.max_retries) + ")");
  } else {
    observability::record_info("daemon", "Escalation: disabled");
  }
  observability::record_info(
      "daemon", "Notifications - desktop: " +
                    std::string(cfg.notification.desktop.enabled ? "on" : "off") + ", ntfy: " +
                    (cfg.notification.ntfy.enabled ? "on (" + cfg.notification.ntfy.topic + ")"
                                                   : std::string("off")));

  auto monitor = ctx.create_monitor();
  const auto store = ctx.state_store();
  daemon::Daemon daemon(cfg, *monitor, store);
  const auto started = daemon.start(daemon::DaemonOptions{
      .interval = std::chrono::seconds(cfg.interval_secs), .lock_file = cfg.lock_file});
  if (!started.ok()) {
    std::cerr << started.error() << "\n";
    return 1;
  }

  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  std::optional<std::chrono::steady_clock::time_point> deadline;
  if (!duration_raw.empty()) {
    try {
      deadline = std::chrono::steady_clock::now() + std::chrono::seconds(std::stoul(duration_raw));
    } catch (const std::exception &) {
      std::cerr << "invalid --duration-secs: " << duration_raw << "\n";
      daemon.stop();
      return 1;
    }
  }

  while (g_stop_requested == 0 && daemon.is_running()) {
    if (deadline.has_value() && std::chrono::steady_clock::now() >= *deadline) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }
  daemon.stop();
  observability::record_info("daemon", "stopped after " +
                                           std::to_string(daemon.cycles_completed()) + " cycle(s)");
  return 0;
}

int run_watchdog() {
  auto context = open_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto &ctx = context.value();

  auto monitor = ctx.create_monitor();
  const auto store = ctx.state_store();
  const auto run = daemon::run_watchdog(ctx.config(), *monitor, store, ctx.supervisor(),
                                        ctx.notifier(), common::thread_sleeper());
  if (!run.ok()) {
    std::cerr << run.error() << "\n";
    return 1;
  }
  return run.value().report.healthy() ? 0 : 1;
}

int run_status() {
  auto context = open_context();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto &ctx = context.value();
  const auto &cfg = ctx.config();

  bool scheduled = false;
  if (!cfg.scheduler.query_command.empty()) {
    process::CommandOptions options;
    options.timeout = std::chrono::seconds(10);
    const auto query = ctx.runner().run(cfg.scheduler.query_command, options);
    if (query.ok) {
      scheduled = true;
      std::cout << "=== Scheduled task ===\n" << query.output << "\n";
    }
  }
  if (!scheduled) {
    std::cout << "clawwatch: not registered as scheduled task\n";
  }

  std::error_code ec;
  if (!std::filesystem::exists(cfg.state_file, ec)) {
    std::cout << "\nNo state file found (watchdog has not run yet)\n";
    return 0;
  }

  const auto snapshot = ctx.state_store().load(cfg.service_names());
  std::cout << "\n";
  for (const auto &line : monitor::format_status_lines(snapshot, common::now_ms())) {
    std::cout << line << "\n";
  }
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  clawwatch [--config PATH] <command> [options]\n\n";
  std::cout << "COMMANDS\n";
  std::cout << "  check          Run one check cycle; exit 0 when every service is healthy\n";
  std::cout << "  daemon         Check continuously at the configured interval\n";
  std::cout << "    --duration-secs N   stop after N seconds\n";
  std::cout << "  watchdog       Rescue the supervisor if needed, run one cycle, save state\n";
  std::cout << "  status         Show the scheduler view and the last saved state\n";
  std::cout << "  version        Print the version\n";
  std::cout << "  help           Show this help\n\n";
  std::cout << "CONFIG\n";
  std::cout << "  --config PATH or CLAWWATCH_CONFIG_PATH, else the first of\n";
  std::cout << "  config.local.toml, config.toml, config.example.toml in $CLAWWATCH_HOME\n";
  std::cout << "  (default ~/.clawwatch)\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    return run_check();
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "check") {
    return run_check();
  }
  if (subcommand == "daemon") {
    return run_daemon(std::move(args));
  }
  if (subcommand == "watchdog") {
    return run_watchdog();
  }
  if (subcommand == "status") {
    return run_status();
  }

  std::cerr << "Unknown command: " << subcommand << "\n\n";
  print_help();
  return 1;
}

} // namespace clawwatch::cli
