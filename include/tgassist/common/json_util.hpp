#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace tgassist::common {

/// Escape a string for embedding inside a JSON string literal.
/// Control characters are written as \u00XX.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string, including \uXXXX sequences and surrogate
/// pairs (decoded to UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Parse a flat JSON object into a key→value map. String values are unescaped;
/// objects, arrays, numbers and literals are kept as raw JSON text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// Split a JSON array of strings into unescaped values.
[[nodiscard]] std::vector<std::string> json_split_string_array(const std::string &array_json);

} // namespace tgassist::common
