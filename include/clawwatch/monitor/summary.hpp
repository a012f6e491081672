#pragma once

#include "clawwatch/config/schema.hpp"
#include "clawwatch/monitor/monitor.hpp"

#include <string>
#include <vector>

namespace clawwatch::monitor {

[[nodiscard]] std::string status_icon(state::ServiceStatus status);

/// `ALL OK | GW:✓ KT:✓` or `ALERT  | GW:✓ KT:✗`, services in configuration order.
[[nodiscard]] std::string format_summary(const config::Config &config, const CycleReport &report);

enum class RouteHealth {
  Healthy,
  Degraded,
  // Every member is disabled.
  Skipped,
};

struct RouteStatus {
  std::string id;
  std::string label;
  RouteHealth health = RouteHealth::Healthy;
  // Display names of the members that are not ok.
  std::vector<std::string> issues;
};

/// A route is healthy when each enabled member is ok; disabled members are ignored.
[[nodiscard]] std::vector<RouteStatus> evaluate_routes(const config::Config &config,
                                                       const CycleReport &report);

[[nodiscard]] std::string format_route(const RouteStatus &route);

[[nodiscard]] std::vector<std::string> format_status_lines(const state::Snapshot &snapshot,
                                                           std::int64_t now_ms);

} // namespace clawwatch::monitor
