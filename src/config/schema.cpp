#include "clawwatch/config/schema.hpp"

namespace clawwatch::config {

const ServiceConfig *Config::find_service(const std::string &name) const {
  for (const auto &service : services) {
    if (service.name == name) {
      return &service;
    }
  }
  return nullptr;
}

std::optional<std::string> Config::ecosystem_path(const std::string &label) const {
  if (label.empty()) {
    return std::nullopt;
  }
  for (const auto &[name, path] : ecosystems) {
    if (name == label) {
      return path;
    }
  }
  return std::nullopt;
}

std::vector<std::string> Config::service_names() const {
  std::vector<std::string> names;
  names.reserve(services.size());
  for (const auto &service : services) {
    names.push_back(service.name);
  }
  return names;
}

std::string to_string(const ProbeKind kind) {
  switch (kind) {
  case ProbeKind::Http:
    return "http";
  case ProbeKind::Supervisor:
    return "supervisor";
  case ProbeKind::OsService:
    return "os_service";
  }
  return "http";
}

std::string to_string(const RepairKind kind) {
  switch (kind) {
  case RepairKind::None:
    return "none";
  case RepairKind::Supervisor:
    return "supervisor";
  case RepairKind::OsService:
    return "os_service";
  case RepairKind::Command:
    return "command";
  }
  return "none";
}

} // namespace clawwatch::config
