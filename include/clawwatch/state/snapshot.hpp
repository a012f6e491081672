#pragma once

#include "clawwatch/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace clawwatch::state {

enum class ServiceStatus {
  Unknown,
  Ok,
  Fail,
  Disabled,
};

[[nodiscard]] std::string to_string(ServiceStatus status);
/// Unrecognised words map to Unknown.
[[nodiscard]] ServiceStatus service_status_from_string(const std::string &value);

struct ServiceRecord {
  ServiceStatus status = ServiceStatus::Unknown;
  // Most recent transition into Fail.
  std::optional<std::int64_t> last_failure_ms;
  // Most recent notification about this service; drives the notification cooldown.
  std::optional<std::int64_t> last_notify_ms;

  bool operator==(const ServiceRecord &) const = default;
};

struct EscalationState {
  std::optional<std::int64_t> last_attempt_ms;
  // Attempts since the last fully healthy cycle.
  std::uint32_t attempt_count = 0;

  bool operator==(const EscalationState &) const = default;
};

struct Snapshot {
  // Keeps configuration order so saved files and summaries are stable.
  std::vector<std::pair<std::string, ServiceRecord>> services;
  EscalationState escalation;
  std::optional<std::int64_t> updated_at_ms;

  ServiceRecord &record(const std::string &name);
  [[nodiscard]] const ServiceRecord *find(const std::string &name) const;

  bool operator==(const Snapshot &) const = default;
};

[[nodiscard]] Snapshot default_snapshot(const std::vector<std::string> &service_names);

[[nodiscard]] std::string serialize_snapshot(const Snapshot &snapshot);

/// Fails when `json` is not a single JSON object. Unknown keys are ignored and missing keys
/// keep their defaults.
[[nodiscard]] common::Result<Snapshot> parse_snapshot(const std::string &json);

} // namespace clawwatch::state
