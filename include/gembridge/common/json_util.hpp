#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace gembridge::common {

enum class JsonKind { Null, Bool, Number, String, Array, Object };

/// One top-level member of a JSON object. Strings hold their unescaped
/// contents; every other kind holds the raw JSON text of the value.
struct JsonField {
  JsonKind kind = JsonKind::Null;
  std::string text;
};

using JsonObject = std::unordered_map<std::string, JsonField>;

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Quote and escape a string as a JSON string literal.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape the body of a JSON string literal, including \uXXXX sequences
/// (emitted as UTF-8, surrogate pairs combined).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Strict check that text holds exactly one JSON value, optionally padded
/// with whitespace.
[[nodiscard]] bool json_validate(const std::string &text);

/// Kind of the top-level value, or nullopt when the text is not valid JSON.
[[nodiscard]] std::optional<JsonKind> json_value_kind(const std::string &text);

/// Top-level members of a JSON object. nullopt when the text is not valid
/// JSON or its top-level value is not an object. Later duplicate keys win.
[[nodiscard]] std::optional<JsonObject> json_parse_object(const std::string &text);

/// Convenience lookups on a parsed object; empty/nullopt when the member is
/// absent or of another kind.
[[nodiscard]] std::optional<std::string> json_string_field(const JsonObject &object,
                                                           const std::string &key);
[[nodiscard]] std::optional<bool> json_bool_field(const JsonObject &object,
                                                  const std::string &key);

/// Render raw JSON values as a pretty-printed array, one element per line.
[[nodiscard]] std::string json_pretty_array(const std::vector<std::string> &raw_values);

} // namespace gembridge::common
