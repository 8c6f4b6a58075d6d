#pragma once

#include <cstddef>
#include <map>
#include <string>
#include <unordered_map>
#include <vector>

namespace cowork::common {

/// Escape a string for embedding inside a JSON string literal.
/// Control characters are written as \uXXXX.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Quote and escape a string as a JSON string literal.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape a JSON-encoded string body, including \uXXXX sequences (UTF-8 output).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key,
                                        std::size_t from = 0);
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures, skipping string contents.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &json,
                                                              const std::string &field);

/// Top-level members of an object. Strings are unescaped; nested objects, arrays and
/// scalars are kept as raw JSON text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// True when `text` is a single well-formed JSON object (whitespace around it allowed).
[[nodiscard]] bool json_is_object(const std::string &text);

/// Substring from the first '{' to the last '}' inclusive, or the trimmed input when no
/// such frame exists. Idempotent.
[[nodiscard]] std::string extract_json_frame(const std::string &text);

/// Every balanced, well-formed top-level JSON object embedded in free text.
[[nodiscard]] std::vector<std::string> find_json_objects(const std::string &text);

/// Serialize an ordered string map as a JSON object with string values.
[[nodiscard]] std::string json_object_from_map(const std::map<std::string, std::string> &values);

} // namespace cowork::common
