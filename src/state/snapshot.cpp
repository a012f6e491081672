#include "clawwatch/state/snapshot.hpp"

#include "clawwatch/common/json_util.hpp"

#include <algorithm>
#include <limits>
#include <sstream>

namespace clawwatch::state {

namespace {

std::string optional_ms(const std::optional<std::int64_t> &value) {
  return value.has_value() ? std::to_string(*value) : "null";
}

ServiceRecord parse_record(const std::string &json) {
  ServiceRecord record;
  const auto fields = common::json_parse_flat(json);
  if (const auto it = fields.find("status"); it != fields.end()) {
    record.status = service_status_from_string(it->second);
  }
  if (const auto it = fields.find("last_failure_ms"); it != fields.end()) {
    record.last_failure_ms = common::json_to_int(it->second);
  }
  if (const auto it = fields.find("last_notify_ms"); it != fields.end()) {
    record.last_notify_ms = common::json_to_int(it->second);
  }
  return record;
}

// Negative or malformed counts read as 0; counts past the 32-bit range saturate.
std::uint32_t parse_attempt_count(const std::string &raw) {
  const auto parsed = common::json_to_int(raw);
  if (!parsed.has_value()) {
    return 0;
  }
  return static_cast<std::uint32_t>(std::min<std::int64_t>(
      *parsed, static_cast<std::int64_t>(std::numeric_limits<std::uint32_t>::max())));
}

} // namespace

std::string to_string(const ServiceStatus status) {
  switch (status) {
  case ServiceStatus::Unknown:
    return "unknown";
  case ServiceStatus::Ok:
    return "ok";
  case ServiceStatus::Fail:
    return "fail";
  case ServiceStatus::Disabled:
    return "disabled";
  }
  return "unknown";
}

ServiceStatus service_status_from_string(const std::string &value) {
  if (value == "ok") {
    return ServiceStatus::Ok;
  }
  if (value == "fail") {
    return ServiceStatus::Fail;
  }
  if (value == "disabled") {
    return ServiceStatus::Disabled;
  }
  return ServiceStatus::Unknown;
}

ServiceRecord &Snapshot::record(const std::string &name) {
  for (auto &[service, record] : services) {
    if (service == name) {
      return record;
    }
  }
  services.emplace_back(name, ServiceRecord{});
  return services.back().second;
}

const ServiceRecord *Snapshot::find(const std::string &name) const {
  for (const auto &[service, record] : services) {
    if (service == name) {
      return &record;
    }
  }
  return nullptr;
}

Snapshot default_snapshot(const std::vector<std::string> &service_names) {
  Snapshot snapshot;
  for (const auto &name : service_names) {
    (void)snapshot.record(name);
  }
  return snapshot;
}

std::string serialize_snapshot(const Snapshot &snapshot) {
  std::ostringstream json;
  json << "{\n";
  json << "  \"services\": {";
  bool first = true;
  for (const auto &[name, record] : snapshot.services) {
    json << (first ? "\n" : ",\n");
    first = false;
    json << "    \"" << common::json_escape(name) << "\": {";
    json << "\"status\": \"" << to_string(record.status) << "\", ";
    json << "\"last_failure_ms\": " << optional_ms(record.last_failure_ms) << ", ";
    json << "\"last_notify_ms\": " << optional_ms(record.last_notify_ms) << "}";
  }
  json << (snapshot.services.empty() ? "},\n" : "\n  },\n");
  json << "  \"escalation\": {";
  json << "\"last_attempt_ms\": " << optional_ms(snapshot.escalation.last_attempt_ms) << ", ";
  json << "\"attempt_count\": " << snapshot.escalation.attempt_count << "},\n";
  json << "  \"updated_at_ms\": " << optional_ms(snapshot.updated_at_ms) << "\n";
  json << "}\n";
  return json.str();
}

common::Result<Snapshot> parse_snapshot(const std::string &json) {
  if (!common::json_is_object(json)) {
    return common::Result<Snapshot>::failure("state is not a JSON object");
  }

  Snapshot snapshot;
  for (const auto &[key, value] : common::json_parse_ordered(json)) {
    if (key == "services") {
      for (const auto &[name, record] : common::json_parse_ordered(value)) {
        snapshot.record(name) = parse_record(record);
      }
    } else if (key == "escalation") {
      const auto fields = common::json_parse_flat(value);
      if (const auto it = fields.find("last_attempt_ms"); it != fields.end()) {
        snapshot.escalation.last_attempt_ms = common::json_to_int(it->second);
      }
      if (const auto it = fields.find("attempt_count"); it != fields.end()) {
        snapshot.escalation.attempt_count = parse_attempt_count(it->second);
      }
    } else if (key == "updated_at_ms") {
      snapshot.updated_at_ms = common::json_to_int(value);
    }
  }
  return common::Result<Snapshot>::success(std::move(snapshot));
}

} // namespace clawwatch::state
