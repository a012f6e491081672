#include "clawwatch/state/store.hpp"

#include "clawwatch/common/fs.hpp"
#include "clawwatch/observability/global.hpp"

namespace clawwatch::state {

StateStore::StateStore(std::filesystem::path path) : path_(std::move(path)) {}

Snapshot StateStore::load(const std::vector<std::string> &service_names) const {
  std::error_code ec;
  if (!std::filesystem::exists(path_, ec)) {
    return default_snapshot(service_names);
  }

  const auto content = common::read_text_file(path_);
  if (!content.ok()) {
    observability::record_warning("state", content.error() + "; starting from defaults");
    return default_snapshot(service_names);
  }

  auto parsed = parse_snapshot(content.value());
  if (!parsed.ok()) {
    observability::record_warning("state", path_.string() + " is corrupt (" + parsed.error() +
                                               "); starting from defaults");
    return default_snapshot(service_names);
  }

  Snapshot snapshot = std::move(parsed.value());
  for (const auto &name : service_names) {
    (void)snapshot.record(name);
  }
  return snapshot;
}

common::Status StateStore::save(const Snapshot &snapshot) const {
  return common::write_text_file_atomic(path_, serialize_snapshot(snapshot));
}

} // namespace clawwatch::state
