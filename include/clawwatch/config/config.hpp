#pragma once

#include "clawwatch/common/result.hpp"
#include "clawwatch/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace clawwatch::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();

/// Candidate files in precedence order: local override, defaults, example template.
[[nodiscard]] std::vector<std::filesystem::path> config_candidates(const std::filesystem::path &dir);

/// First existing candidate. An explicit override (`--config` or `CLAWWATCH_CONFIG_PATH`)
/// wins over the directory search and must exist.
[[nodiscard]] common::Result<std::filesystem::path> resolve_config_path();
[[nodiscard]] common::Result<std::filesystem::path>
resolve_config_path(const std::filesystem::path &dir);

void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> parse_config(const std::string &content,
                                                  const std::filesystem::path &source_path);
[[nodiscard]] common::Result<Config> load_config_file(const std::filesystem::path &path);
[[nodiscard]] common::Result<Config> load_config();

/// Hard errors fail the result; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace clawwatch::config
