#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace clawwatch::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string (handles \n, \r, \t and pass-through).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// True when `json` is a single balanced object, ignoring surrounding whitespace.
[[nodiscard]] bool json_is_object(const std::string &json);

/// Parse the top level of a JSON object into key -> raw value. String values are
/// unescaped; objects, arrays, numbers and literals are kept as their source text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Same as json_parse_flat but keeps the keys in document order.
using JsonOrderedMap = std::vector<std::pair<std::string, std::string>>;
[[nodiscard]] JsonOrderedMap json_parse_ordered(const std::string &json);

/// Interpret a raw flat-map value as a non-negative integer; `null` or garbage yields nullopt.
[[nodiscard]] std::optional<std::int64_t> json_to_int(const std::string &raw);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

} // namespace clawwatch::common
