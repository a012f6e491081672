#pragma once

#include "clawwatch/common/result.hpp"
#include "clawwatch/state/snapshot.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace clawwatch::state {

class StateStore {
public:
  explicit StateStore(std::filesystem::path path);

  /// Never fails: a missing or unreadable file yields the all-unknown snapshot. Records kept
  /// in the file for services that are no longer configured survive the round trip.
  [[nodiscard]] Snapshot load(const std::vector<std::string> &service_names) const;

  /// Replaces the file atomically. Errors are for the caller to log.
  [[nodiscard]] common::Status save(const Snapshot &snapshot) const;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

} // namespace clawwatch::state
