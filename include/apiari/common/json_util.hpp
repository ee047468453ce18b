#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace apiari::common {

/// Escape a string for embedding inside a JSON string literal.
/// Control characters are always escaped, so the result never spans lines.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string body (named escapes and \uXXXX, decoded to UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Find the position of a JSON key in a JSON string.
[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key,
                                        std::size_t from = 0);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Extract a string field value from a JSON document.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// Extract a numeric field value (as string) from a JSON document.
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);

/// Extract a boolean field value ("true"/"false"), or "" when absent or not a boolean.
[[nodiscard]] std::string json_get_bool(const std::string &json, const std::string &field);

/// Extract a nested JSON object field (including braces) from a JSON document.
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);

/// Extract a nested JSON array field (including brackets) from a JSON document.
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Extract a string array from a JSON array string like ["a","b"].
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &json,
                                                              const std::string &field);

/// Parse a flat JSON object into a key→value map (string values only, top-level).
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Strict well-formedness check: exactly one JSON value, optionally surrounded by whitespace.
[[nodiscard]] bool json_is_valid(const std::string &text);

/// Re-indent a well-formed JSON value. indent <= 0 produces compact output.
/// Input that fails json_is_valid is returned unchanged.
[[nodiscard]] std::string json_pretty(const std::string &json, int indent = 2);

} // namespace apiari::common
