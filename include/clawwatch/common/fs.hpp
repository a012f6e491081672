#pragma once

#include "clawwatch/common/result.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace clawwatch::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::vector<std::string> split_lines(const std::string &text);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

[[nodiscard]] Result<std::string> read_text_file(const std::filesystem::path &path);

/// Write `content` to `<path>.tmp` and rename it over `path`, so readers never observe a
/// partially written file.
[[nodiscard]] Status write_text_file_atomic(const std::filesystem::path &path,
                                            const std::string &content);

} // namespace clawwatch::common
