#include "clawwatch/config/config.hpp"

#include "clawwatch/common/fs.hpp"
#include "clawwatch/common/toml.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <set>

namespace clawwatch::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".clawwatch";
constexpr const char *LOCAL_CONFIG_FILENAME = "config.local.toml";
constexpr const char *DEFAULT_CONFIG_FILENAME = "config.toml";
constexpr const char *EXAMPLE_CONFIG_FILENAME = "config.example.toml";
constexpr const char *DEFAULT_STATE_FILENAME = "monitor-state.json";
constexpr const char *DEFAULT_LOCK_FILENAME = "monitor.pid";

std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("CLAWWATCH_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string default_short_name(const std::string &name) {
  std::string out;
  for (const char ch : name) {
    if (std::isalnum(static_cast<unsigned char>(ch)) == 0) {
      continue;
    }
    out.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(ch))));
    if (out.size() == 2) {
      break;
    }
  }
  return out.empty() ? "?" : out;
}

std::filesystem::path resolve_relative(const std::filesystem::path &base_dir,
                                       const std::string &value) {
  std::filesystem::path path(common::expand_path(value));
  if (path.is_relative() && !base_dir.empty()) {
    path = base_dir / path;
  }
  return path.lexically_normal();
}

// Values that do not fit a port number are rejected instead of wrapping.
common::Result<std::uint16_t> get_u16(const common::TomlDocument &doc, const std::string &key,
                                      const std::uint16_t fallback) {
  const std::uint64_t value = doc.get_u64(key, fallback);
  if (value > 65535) {
    return common::Result<std::uint16_t>::failure(key + " = " + std::to_string(value) +
                                                  " is out of range (0-65535)");
  }
  return common::Result<std::uint16_t>::success(static_cast<std::uint16_t>(value));
}

common::Result<ProbeKind> parse_probe_kind(const std::string &raw) {
  const std::string value = common::to_lower(common::trim(raw));
  if (value == "http") {
    return common::Result<ProbeKind>::success(ProbeKind::Http);
  }
  if (value == "supervisor" || value == "pm2") {
    return common::Result<ProbeKind>::success(ProbeKind::Supervisor);
  }
  if (value == "os_service" || value == "service" || value == "systemd") {
    return common::Result<ProbeKind>::success(ProbeKind::OsService);
  }
  return common::Result<ProbeKind>::failure("unknown probe kind '" + raw + "'");
}

common::Result<RepairKind> parse_repair_kind(const std::string &raw) {
  const std::string value = common::to_lower(common::trim(raw));
  if (value == "none" || value.empty()) {
    return common::Result<RepairKind>::success(RepairKind::None);
  }
  if (value == "supervisor" || value == "pm2") {
    return common::Result<RepairKind>::success(RepairKind::Supervisor);
  }
  if (value == "os_service" || value == "service" || value == "systemd") {
    return common::Result<RepairKind>::success(RepairKind::OsService);
  }
  if (value == "command") {
    return common::Result<RepairKind>::success(RepairKind::Command);
  }
  return common::Result<RepairKind>::failure("unknown repair kind '" + raw + "'");
}

RepairKind default_repair_for(const ServiceConfig &service) {
  switch (service.probe) {
  case ProbeKind::Supervisor:
    return RepairKind::Supervisor;
  case ProbeKind::OsService:
    return RepairKind::OsService;
  case ProbeKind::Http:
    return service.repair_command.empty() ? RepairKind::None : RepairKind::Command;
  }
  return RepairKind::None;
}

common::Result<ServiceConfig> load_service(const common::TomlDocument &doc, const std::string &name) {
  const std::string p = "services." + name + ".";
  ServiceConfig service;
  service.name = name;
  service.enabled = doc.get_bool(p + "enabled", service.enabled);
  service.label = doc.get_string(p + "label", name);
  service.short_name = doc.get_string(p + "short_name", default_short_name(name));

  auto probe = parse_probe_kind(doc.get_string(p + "probe", "http"));
  if (!probe.ok()) {
    return common::Result<ServiceConfig>::failure("services." + name + ".probe: " + probe.error());
  }
  service.probe = probe.value();
  service.probe_url = doc.get_string(p + "probe_url");
  const auto port = get_u16(doc, p + "port", 0);
  if (!port.ok()) {
    return common::Result<ServiceConfig>::failure(port.error());
  }
  service.port = port.value();
  const auto alive_below = get_u16(doc, p + "alive_below", service.alive_below);
  if (!alive_below.ok()) {
    return common::Result<ServiceConfig>::failure(alive_below.error());
  }
  service.alive_below = alive_below.value();
  service.process = doc.get_string(p + "process");
  service.ping_url = doc.get_string(p + "ping_url");
  service.expect_body = doc.get_string(p + "expect_body");
  service.unit = doc.get_string(p + "unit", name);
  service.expect_state = doc.get_string(p + "expect_state", service.expect_state);
  service.verify_command = doc.get_string(p + "verify_command");
  service.verify_contains = doc.get_string(p + "verify_contains");
  service.verify_rejects = doc.get_string(p + "verify_rejects");
  service.timeout_ms = doc.get_u64(p + "timeout_ms", service.timeout_ms);

  service.ecosystem = doc.get_string(p + "ecosystem");
  service.repair_command = doc.get_string(p + "repair_command");
  service.fallback_command = doc.get_string(p + "fallback_command");
  service.repair_attempts =
      static_cast<std::uint32_t>(doc.get_u64(p + "repair_attempts", service.repair_attempts));
  service.settle_ms = doc.get_u64(p + "settle_ms", service.settle_ms);

  if (doc.has(p + "repair")) {
    auto repair = parse_repair_kind(doc.get_string(p + "repair"));
    if (!repair.ok()) {
      return common::Result<ServiceConfig>::failure("services." + name + ".repair: " +
                                                    repair.error());
    }
    service.repair = repair.value();
  } else {
    service.repair = default_repair_for(service);
  }

  return common::Result<ServiceConfig>::success(std::move(service));
}

bool env_flag(const char *raw, const bool fallback) {
  const std::string value = common::to_lower(common::trim(raw));
  if (value == "1" || value == "true" || value == "yes" || value == "on") {
    return true;
  }
  if (value == "0" || value == "false" || value == "no" || value == "off") {
    return false;
  }
  return fallback;
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const char *env = std::getenv("CLAWWATCH_HOME"); env != nullptr && *env != '\0') {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(env)));
  }
  auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

std::vector<std::filesystem::path> config_candidates(const std::filesystem::path &dir) {
  return {dir / LOCAL_CONFIG_FILENAME, dir / DEFAULT_CONFIG_FILENAME,
          dir / EXAMPLE_CONFIG_FILENAME};
}

common::Result<std::filesystem::path> resolve_config_path(const std::filesystem::path &dir) {
  std::string tried;
  for (const auto &candidate : config_candidates(dir)) {
    std::error_code ec;
    if (std::filesystem::is_regular_file(candidate, ec)) {
      return common::Result<std::filesystem::path>::success(candidate);
    }
    if (!tried.empty()) {
      tried += ", ";
    }
    tried += candidate.string();
  }
  return common::Result<std::filesystem::path>::failure("No config file found (" + tried + ")");
}

common::Result<std::filesystem::path> resolve_config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(*override_path, ec)) {
      return common::Result<std::filesystem::path>::failure("Config file not found: " +
                                                            override_path->string());
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  auto dir = config_dir();
  if (!dir.ok()) {
    return common::Result<std::filesystem::path>::failure(dir.error());
  }
  return resolve_config_path(dir.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override.reset(); }

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

common::Result<Config> parse_config(const std::string &content,
                                    const std::filesystem::path &source_path) {
  auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure("Failed to parse " + source_path.string() + ": " +
                                           parsed.error());
  }
  const auto &doc = parsed.value();
  const std::filesystem::path base_dir = source_path.parent_path();

  Config config;
  config.source_path = source_path;
  config.interval_secs = doc.get_u64("interval", config.interval_secs);
  config.auto_repair = doc.get_bool("auto_repair", config.auto_repair);
  config.state_file =
      resolve_relative(base_dir, doc.get_string("state_file", DEFAULT_STATE_FILENAME));
  config.lock_file = resolve_relative(base_dir, doc.get_string("lock_file", DEFAULT_LOCK_FILENAME));

  config.supervisor.command = doc.get_string("supervisor.command", config.supervisor.command);
  if (doc.has("supervisor.cwd")) {
    config.supervisor.cwd = resolve_relative(base_dir, doc.get_string("supervisor.cwd")).string();
  }
  config.supervisor.timeout_secs =
      doc.get_u64("supervisor.timeout_secs", config.supervisor.timeout_secs);
  config.supervisor.start_timeout_secs =
      doc.get_u64("supervisor.start_timeout_secs", config.supervisor.start_timeout_secs);
  config.supervisor.bootstrap_settle_ms =
      doc.get_u64("supervisor.bootstrap_settle_ms", config.supervisor.bootstrap_settle_ms);

  config.os_service.command = doc.get_string("os_service.command", config.os_service.command);
  config.os_service.timeout_secs =
      doc.get_u64("os_service.timeout_secs", config.os_service.timeout_secs);

  for (const auto &label : doc.child_keys("ecosystems")) {
    config.ecosystems.emplace_back(
        label, resolve_relative(base_dir, doc.get_string("ecosystems." + label)).string());
  }

  auto &notification = config.notification;
  notification.cooldown_secs = doc.get_u64("notification.cooldown", notification.cooldown_secs);
  notification.on_recover = doc.get_bool("notification.on_recover", notification.on_recover);
  notification.title = doc.get_string("notification.title", notification.title);
  notification.desktop.enabled =
      doc.get_bool("notification.desktop.enabled", notification.desktop.enabled);
  notification.desktop.silent =
      doc.get_bool("notification.desktop.silent", notification.desktop.silent);
  notification.ntfy.enabled = doc.get_bool("notification.ntfy.enabled", notification.ntfy.enabled);
  notification.ntfy.server = doc.get_string("notification.ntfy.server", notification.ntfy.server);
  notification.ntfy.topic = doc.get_string("notification.ntfy.topic", notification.ntfy.topic);
  notification.ntfy.priority =
      doc.get_string("notification.ntfy.priority", notification.ntfy.priority);
  notification.ntfy.critical_priority =
      doc.get_string("notification.ntfy.critical_priority", notification.ntfy.critical_priority);
  notification.ntfy.tags = doc.get_string_array("notification.ntfy.tags", notification.ntfy.tags);
  notification.ntfy.timeout_secs =
      doc.get_u64("notification.ntfy.timeout_secs", notification.ntfy.timeout_secs);

  auto &escalation = config.escalation;
  escalation.enabled = doc.get_bool("escalation.enabled", escalation.enabled);
  escalation.cooldown_secs = doc.get_u64("escalation.cooldown", escalation.cooldown_secs);
  escalation.max_retries =
      static_cast<std::uint32_t>(doc.get_u64("escalation.max_retries", escalation.max_retries));
  if (doc.has("escalation.script_path")) {
    escalation.script_path =
        resolve_relative(base_dir, doc.get_string("escalation.script_path")).string();
  }
  escalation.interpreter = doc.get_string("escalation.interpreter", escalation.interpreter);
  escalation.timeout_secs = doc.get_u64("escalation.timeout_secs", escalation.timeout_secs);

  config.scheduler.query_command =
      doc.get_string("scheduler.query_command", config.scheduler.query_command);
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  for (const auto &name : doc.child_tables("services")) {
    auto service = load_service(doc, name);
    if (!service.ok()) {
      return common::Result<Config>::failure(service.error());
    }
    config.services.push_back(std::move(service.value()));
  }

  for (const auto &id : doc.child_tables("routes")) {
    RouteConfig route;
    route.id = id;
    route.label = doc.get_string("routes." + id + ".label", id);
    route.services = doc.get_string_array("routes." + id + ".services");
    config.routes.push_back(std::move(route));
  }

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config_file(const std::filesystem::path &path) {
  auto content = common::read_text_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure(content.error());
  }
  auto config = parse_config(content.value(), path);
  if (!config.ok()) {
    return config;
  }
  apply_env_overrides(config.value());
  auto validation = validate_config(config.value());
  if (!validation.ok()) {
    return common::Result<Config>::failure("Invalid config " + path.string() + ": " +
                                           validation.error());
  }
  return config;
}

common::Result<Config> load_config() {
  auto path = resolve_config_path();
  if (!path.ok()) {
    return common::Result<Config>::failure(path.error());
  }
  return load_config_file(path.value());
}

void apply_env_overrides(Config &config) {
  if (const char *topic = std::getenv("CLAWWATCH_NTFY_TOPIC"); topic != nullptr && *topic != '\0') {
    config.notification.ntfy.topic = topic;
  }
  if (const char *repair = std::getenv("CLAWWATCH_AUTO_REPAIR");
      repair != nullptr && *repair != '\0') {
    config.auto_repair = env_flag(repair, config.auto_repair);
  }
  if (const char *state = std::getenv("CLAWWATCH_STATE_FILE"); state != nullptr && *state != '\0') {
    config.state_file = common::expand_path(state);
  }
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (config.interval_secs == 0) {
    return common::Result<std::vector<std::string>>::failure("interval must be > 0");
  }

  std::set<std::string> names;
  for (const auto &service : config.services) {
    if (!names.insert(service.name).second) {
      return common::Result<std::vector<std::string>>::failure("duplicate service: " +
                                                                service.name);
    }
    const std::string p = "services." + service.name;
    if (service.probe == ProbeKind::Http && service.probe_url.empty() && service.port == 0) {
      return common::Result<std::vector<std::string>>::failure(
          p + " needs probe_url or port for an http probe");
    }
    if ((service.probe == ProbeKind::Supervisor || service.repair == RepairKind::Supervisor) &&
        service.process.empty()) {
      return common::Result<std::vector<std::string>>::failure(
          p + ".process is required for supervisor probes and repairs");
    }
    if (service.repair == RepairKind::Command && service.repair_command.empty()) {
      return common::Result<std::vector<std::string>>::failure(
          p + ".repair_command is required for command repairs");
    }
    if (service.alive_below < 101 || service.alive_below > 600) {
      return common::Result<std::vector<std::string>>::failure(
          p + ".alive_below must be an HTTP status bound between 101 and 600");
    }
    if (service.timeout_ms == 0) {
      return common::Result<std::vector<std::string>>::failure(p + ".timeout_ms must be > 0");
    }
    if (!service.ecosystem.empty() && !config.ecosystem_path(service.ecosystem).has_value()) {
      warnings.push_back(p + ".ecosystem '" + service.ecosystem + "' is not declared in [ecosystems]");
    }
  }

  for (const auto &route : config.routes) {
    for (const auto &name : route.services) {
      if (!names.contains(name)) {
        return common::Result<std::vector<std::string>>::failure(
            "routes." + route.id + " references unknown service: " + name);
      }
    }
  }

  if (config.escalation.enabled) {
    if (config.escalation.script_path.empty()) {
      return common::Result<std::vector<std::string>>::failure(
          "escalation.script_path is required when escalation is enabled");
    }
    if (config.escalation.timeout_secs == 0) {
      return common::Result<std::vector<std::string>>::failure(
          "escalation.timeout_secs must be > 0");
    }
    std::error_code ec;
    if (!std::filesystem::exists(config.escalation.script_path, ec)) {
      warnings.push_back("escalation.script_path does not exist: " + config.escalation.script_path);
    }
  }

  if (config.notification.ntfy.enabled && common::trim(config.notification.ntfy.topic).empty()) {
    warnings.push_back("notification.ntfy is enabled without a topic; pushes are skipped");
  }
  if (config.services.empty()) {
    warnings.push_back("no services configured");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace clawwatch::config
