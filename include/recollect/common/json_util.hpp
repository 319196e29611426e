#pragma once

#include "recollect/common/result.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace recollect::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape a JSON-encoded string, including \uXXXX sequences (emitted as UTF-8).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key,
                                        std::size_t from = 0);
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// True when `json` (after surrounding whitespace) is one balanced object.
[[nodiscard]] bool json_is_object(const std::string &json);

[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);
[[nodiscard]] std::vector<std::string> json_get_string_array(const std::string &json,
                                                              const std::string &field);

/// Parse `[0.1, -2, 3e-4]` into floats. Fails on any non-numeric element.
[[nodiscard]] Result<std::vector<float>> json_parse_float_array(const std::string &array_json);

/// Top-level members of an object. String values are unescaped; objects,
/// arrays, numbers and literals are kept as raw JSON text.
struct JsonField {
  std::string value;
  bool is_string = false;
};
using JsonFlatMap = std::unordered_map<std::string, JsonField>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// Split a JSON array into its elements, whatever their kind, in order.
[[nodiscard]] std::vector<std::string> json_split_top_level_values(const std::string &array_json);

} // namespace recollect::common
