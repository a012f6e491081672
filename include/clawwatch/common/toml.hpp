#pragma once

#include "clawwatch/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace clawwatch::common {

/// Flat view of a TOML document: `[a.b]` + `key = v` is stored as `a.b.key`.
/// Keys remember the order in which they first appeared in the file.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;
  std::vector<std::string> ordered_keys;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] int get_int(const std::string &key, int fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;

  /// Names directly below `section`, in file order: for `[services.gateway]` and
  /// `[services.bridge]`, `child_tables("services")` is {"gateway", "bridge"}.
  [[nodiscard]] std::vector<std::string> child_tables(const std::string &section) const;

  [[nodiscard]] std::vector<std::string> child_keys(const std::string &section) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace clawwatch::common
