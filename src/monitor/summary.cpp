#include "clawwatch/monitor/summary.hpp"

#include "clawwatch/common/time.hpp"

namespace clawwatch::monitor {

std::string status_icon(const state::ServiceStatus status) {
  switch (status) {
  case state::ServiceStatus::Ok:
    return "✓";
  case state::ServiceStatus::Fail:
    return "✗";
  case state::ServiceStatus::Disabled:
    return "-";
  case state::ServiceStatus::Unknown:
    break;
  }
  return "?";
}

std::string format_summary(const config::Config &config, const CycleReport &report) {
  std::string line = report.healthy() ? "ALL OK" : "ALERT ";
  line += " |";
  for (const auto &service : config.services) {
    line += " " + service.short_name + ":" + status_icon(report.status_of(service.name));
  }
  return line;
}

std::vector<RouteStatus> evaluate_routes(const config::Config &config, const CycleReport &report) {
  std::vector<RouteStatus> out;
  out.reserve(config.routes.size());
  for (const auto &route : config.routes) {
    RouteStatus status{.id = route.id, .label = route.label};
    bool any_enabled = false;
    for (const auto &name : route.services) {
      const auto current = report.status_of(name);
      if (current == state::ServiceStatus::Disabled) {
        continue;
      }
      any_enabled = true;
      if (current != state::ServiceStatus::Ok) {
        const auto *service = config.find_service(name);
        status.issues.push_back(service != nullptr ? service->display_name() : name);
      }
    }
    if (!any_enabled) {
      status.health = RouteHealth::Skipped;
    } else if (!status.issues.empty()) {
      status.health = RouteHealth::Degraded;
    }
    out.push_back(std::move(status));
  }
  return out;
}

std::string format_route(const RouteStatus &route) {
  switch (route.health) {
  case RouteHealth::Healthy:
    return "[OK]   " + route.label + ": All healthy";
  case RouteHealth::Skipped:
    return "[SKIP] " + route.label + ": all services disabled";
  case RouteHealth::Degraded:
    break;
  }
  std::string issues;
  for (const auto &issue : route.issues) {
    if (!issues.empty()) {
      issues += ", ";
    }
    issues += issue;
  }
  return "[FAIL] " + route.label + ": " + issues;
}

std::vector<std::string> format_status_lines(const state::Snapshot &snapshot,
                                             const std::int64_t now_ms) {
  std::vector<std::string> lines;
  if (snapshot.updated_at_ms.has_value()) {
    lines.push_back("=== Last watchdog run: " +
                    common::format_age((now_ms - *snapshot.updated_at_ms) / 1000) + " ago ===");
  } else {
    lines.push_back("=== Last watchdog run: unknown ===");
  }

  for (const auto &[name, record] : snapshot.services) {
    std::string line = "  " + name + ": " + state::to_string(record.status);
    if (record.last_failure_ms.has_value()) {
      line += " (last failure " + common::format_age((now_ms - *record.last_failure_ms) / 1000) +
              " ago)";
    }
    lines.push_back(std::move(line));
  }

  if (snapshot.escalation.attempt_count > 0 || snapshot.escalation.last_attempt_ms.has_value()) {
    std::string line =
        "  escalation: " + std::to_string(snapshot.escalation.attempt_count) + " attempt(s)";
    if (snapshot.escalation.last_attempt_ms.has_value()) {
      line += ", last " +
              common::format_age((now_ms - *snapshot.escalation.last_attempt_ms) / 1000) + " ago";
    }
    lines.push_back(std::move(line));
  }
  return lines;
}

} // namespace clawwatch::monitor
