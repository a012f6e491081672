#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace clawwatch::config {

enum class ProbeKind {
  Http,
  Supervisor,
  OsService,
};

enum class RepairKind {
  None,
  Supervisor,
  OsService,
  Command,
};

struct ServiceConfig {
  std::string name;
  bool enabled = true;
  std::string label;
  std::string short_name;

  ProbeKind probe = ProbeKind::Http;
  std::string probe_url;
  std::uint16_t port = 0;
  // Any HTTP response with a status below this proves the process is alive.
  std::uint16_t alive_below = 500;
  std::string process;
  std::string ping_url;
  std::string expect_body;
  std::string unit;
  std::string expect_state = "active";
  std::string verify_command;
  std::string verify_contains;
  std::string verify_rejects;
  std::uint64_t timeout_ms = 5000;

  RepairKind repair = RepairKind::None;
  std::string ecosystem;
  std::string repair_command;
  std::string fallback_command;
  std::uint32_t repair_attempts = 1;
  std::uint64_t settle_ms = 3000;

  [[nodiscard]] std::string display_name() const { return label.empty() ? name : label; }
};

struct SupervisorConfig {
  std::string command = "pm2";
  std::string cwd;
  std::uint64_t timeout_secs = 20;
  std::uint64_t start_timeout_secs = 30;
  std::uint64_t bootstrap_settle_ms = 3000;
};

struct OsServiceConfig {
  std::string command = "systemctl";
  std::uint64_t timeout_secs = 15;
};

struct DesktopNotificationConfig {
  bool enabled = true;
  bool silent = false;
};

struct NtfyConfig {
  bool enabled = false;
  std::string server = "https://ntfy.sh";
  std::string topic;
  std::string priority = "high";
  std::string critical_priority = "urgent";
  std::vector<std::string> tags;
  std::uint64_t timeout_secs = 10;
};

struct NotificationConfig {
  std::uint64_t cooldown_secs = 300;
  bool on_recover = true;
  std::string title = "OpenClaw Monitor";
  DesktopNotificationConfig desktop;
  NtfyConfig ntfy;
};

struct EscalationConfig {
  bool enabled = false;
  std::uint64_t cooldown_secs = 300;
  std::uint32_t max_retries = 2;
  std::string script_path;
  std::string interpreter = "bash";
  std::uint64_t timeout_secs = 120;
};

struct RouteConfig {
  std::string id;
  std::string label;
  std::vector<std::string> services;
};

struct SchedulerConfig {
  std::string query_command;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  std::filesystem::path source_path;
  std::uint64_t interval_secs = 60;
  bool auto_repair = true;
  std::filesystem::path state_file;
  std::filesystem::path lock_file;

  std::vector<ServiceConfig> services;
  // label -> descriptor path, in file order
  std::vector<std::pair<std::string, std::string>> ecosystems;
  std::vector<RouteConfig> routes;

  SupervisorConfig supervisor;
  OsServiceConfig os_service;
  NotificationConfig notification;
  EscalationConfig escalation;
  SchedulerConfig scheduler;
  ObservabilityConfig observability;

  [[nodiscard]] const ServiceConfig *find_service(const std::string &name) const;
  [[nodiscard]] std::optional<std::string> ecosystem_path(const std::string &label) const;
  [[nodiscard]] std::vector<std::string> service_names() const;
};

[[nodiscard]] std::string to_string(ProbeKind kind);
[[nodiscard]] std::string to_string(RepairKind kind);

} // namespace clawwatch::config
