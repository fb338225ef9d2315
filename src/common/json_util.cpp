#include "gembridge/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <sstream>

namespace gembridge::common {

namespace {

constexpr std::size_t kNpos = std::string::npos;
constexpr int kMaxDepth = 512;

bool is_hex(const char ch) { return std::isxdigit(static_cast<unsigned char>(ch)) != 0; }

bool is_digit(const char ch) { return ch >= '0' && ch <= '9'; }

std::size_t scan_value(const std::string &text, std::size_t pos, int depth);

// Each scanner takes the position of the first character of a value and
// returns the position one past its end, or npos on a syntax error.

std::size_t scan_string(const std::string &text, const std::size_t pos) {
  for (std::size_t i = pos + 1; i < text.size(); ++i) {
    const auto ch = static_cast<unsigned char>(text[i]);
    if (ch == '"') {
      return i + 1;
    }
    if (ch < 0x20) {
      return kNpos;
    }
    if (ch != '\\') {
      continue;
    }
    if (++i >= text.size()) {
      return kNpos;
    }
    switch (text[i]) {
    case '"':
    case '\\':
    case '/':
    case 'b':
    case 'f':
    case 'n':
    case 'r':
    case 't':
      break;
    case 'u':
      for (std::size_t k = 1; k <= 4; ++k) {
        if (i + k >= text.size() || !is_hex(text[i + k])) {
          return kNpos;
        }
      }
      i += 4;
      break;
    default:
      return kNpos;
    }
  }
  return kNpos;
}

std::size_t scan_digits(const std::string &text, std::size_t pos) {
  while (pos < text.size() && is_digit(text[pos])) {
    ++pos;
  }
  return pos;
}

std::size_t scan_number(const std::string &text, const std::size_t pos) {
  std::size_t i = pos;
  if (i < text.size() && text[i] == '-') {
    ++i;
  }
  if (i >= text.size()) {
    return kNpos;
  }
  if (text[i] == '0') {
    ++i;
  } else if (is_digit(text[i])) {
    i = scan_digits(text, i);
  } else {
    return kNpos;
  }
  if (i < text.size() && text[i] == '.') {
    ++i;
    if (i >= text.size() || !is_digit(text[i])) {
      return kNpos;
    }
    i = scan_digits(text, i);
  }
  if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
    ++i;
    if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
      ++i;
    }
    if (i >= text.size() || !is_digit(text[i])) {
      return kNpos;
    }
    i = scan_digits(text, i);
  }
  return i;
}

std::size_t scan_literal(const std::string &text, const std::size_t pos, const std::string &literal) {
  if (text.compare(pos, literal.size(), literal) != 0) {
    return kNpos;
  }
  return pos + literal.size();
}

std::size_t scan_array(const std::string &text, const std::size_t pos, const int depth) {
  std::size_t i = json_skip_ws(text, pos + 1);
  if (i < text.size() && text[i] == ']') {
    return i + 1;
  }
  while (true) {
    i = scan_value(text, i, depth + 1);
    if (i == kNpos) {
      return kNpos;
    }
    i = json_skip_ws(text, i);
    if (i >= text.size()) {
      return kNpos;
    }
    if (text[i] == ',') {
      i = json_skip_ws(text, i + 1);
      continue;
    }
    if (text[i] == ']') {
      return i + 1;
    }
    return kNpos;
  }
}

// Scans "key": value starting at the opening quote of the key. On success
// key_end/value_begin/value_end describe the member.
struct MemberSpan {
  std::size_t key_end = kNpos;
  std::size_t value_begin = kNpos;
  std::size_t value_end = kNpos;
};

bool scan_member(const std::string &text, const std::size_t pos, const int depth,
                 MemberSpan &span) {
  if (pos >= text.size() || text[pos] != '"') {
    return false;
  }
  span.key_end = scan_string(text, pos);
  if (span.key_end == kNpos) {
    return false;
  }
  std::size_t i = json_skip_ws(text, span.key_end);
  if (i >= text.size() || text[i] != ':') {
    return false;
  }
  span.value_begin = json_skip_ws(text, i + 1);
  span.value_end = scan_value(text, span.value_begin, depth + 1);
  return span.value_end != kNpos;
}

std::size_t scan_object(const std::string &text, const std::size_t pos, const int depth) {
  std::size_t i = json_skip_ws(text, pos + 1);
  if (i < text.size() && text[i] == '}') {
    return i + 1;
  }
  while (true) {
    MemberSpan span;
    if (!scan_member(text, i, depth, span)) {
      return kNpos;
    }
    i = json_skip_ws(text, span.value_end);
    if (i >= text.size()) {
      return kNpos;
    }
    if (text[i] == ',') {
      i = json_skip_ws(text, i + 1);
      continue;
    }
    if (text[i] == '}') {
      return i + 1;
    }
    return kNpos;
  }
}

std::size_t scan_value(const std::string &text, const std::size_t pos, const int depth) {
  if (depth > kMaxDepth || pos >= text.size()) {
    return kNpos;
  }
  switch (text[pos]) {
  case '{':
    return scan_object(text, pos, depth);
  case '[':
    return scan_array(text, pos, depth);
  case '"':
    return scan_string(text, pos);
  case 't':
    return scan_literal(text, pos, "true");
  case 'f':
    return scan_literal(text, pos, "false");
  case 'n':
    return scan_literal(text, pos, "null");
  default:
    return scan_number(text, pos);
  }
}

JsonKind kind_of(const char first) {
  switch (first) {
  case '{':
    return JsonKind::Object;
  case '[':
    return JsonKind::Array;
  case '"':
    return JsonKind::String;
  case 't':
  case 'f':
    return JsonKind::Bool;
  case 'n':
    return JsonKind::Null;
  default:
    return JsonKind::Number;
  }
}

void append_utf8(std::string &out, std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

std::optional<std::uint32_t> read_hex4(const std::string &raw, const std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    if (!is_hex(raw[i])) {
      return std::nullopt;
    }
    value = value * 16 +
            static_cast<std::uint32_t>(std::isdigit(static_cast<unsigned char>(raw[i])) != 0
                                           ? raw[i] - '0'
                                           : std::tolower(static_cast<unsigned char>(raw[i])) -
                                                 'a' + 10);
  }
  return value;
}

} // namespace

std::string json_escape(const std::string &value) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        escaped += "\\u00";
        escaped.push_back(kHex[(static_cast<unsigned char>(ch) >> 4) & 0x0F]);
        escaped.push_back(kHex[static_cast<unsigned char>(ch) & 0x0F]);
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      const auto unit = read_hex4(raw, i + 1);
      if (!unit.has_value()) {
        out.push_back(esc);
        break;
      }
      i += 4;
      std::uint32_t cp = *unit;
      if (cp >= 0xD800 && cp <= 0xDBFF) {
        const auto low = (i + 2 < raw.size() && raw[i + 1] == '\\' && raw[i + 2] == 'u')
                             ? read_hex4(raw, i + 3)
                             : std::nullopt;
        if (low.has_value() && *low >= 0xDC00 && *low <= 0xDFFF) {
          cp = 0x10000 + ((cp - 0xD800) << 10) + (*low - 0xDC00);
          i += 6;
        } else {
          cp = 0xFFFD;
        }
      } else if (cp >= 0xDC00 && cp <= 0xDFFF) {
        cp = 0xFFFD;
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() &&
         (text[pos] == ' ' || text[pos] == '\t' || text[pos] == '\n' || text[pos] == '\r')) {
    ++pos;
  }
  return pos;
}

bool json_validate(const std::string &text) { return json_value_kind(text).has_value(); }

std::optional<JsonKind> json_value_kind(const std::string &text) {
  const std::size_t begin = json_skip_ws(text, 0);
  const std::size_t end = scan_value(text, begin, 0);
  if (end == kNpos || json_skip_ws(text, end) != text.size()) {
    return std::nullopt;
  }
  return kind_of(text[begin]);
}

std::optional<JsonObject> json_parse_object(const std::string &text) {
  const std::size_t begin = json_skip_ws(text, 0);
  if (begin >= text.size() || text[begin] != '{') {
    return std::nullopt;
  }

  JsonObject object;
  std::size_t i = json_skip_ws(text, begin + 1);
  if (i < text.size() && text[i] == '}') {
    ++i;
  } else {
    while (true) {
      MemberSpan span;
      if (!scan_member(text, i, 0, span)) {
        return std::nullopt;
      }
      const std::string key = json_unescape(text.substr(i + 1, span.key_end - i - 2));
      JsonField field;
      field.kind = kind_of(text[span.value_begin]);
      if (field.kind == JsonKind::String) {
        field.text = json_unescape(
            text.substr(span.value_begin + 1, span.value_end - span.value_begin - 2));
      } else {
        field.text = text.substr(span.value_begin, span.value_end - span.value_begin);
      }
      object[key] = std::move(field);

      i = json_skip_ws(text, span.value_end);
      if (i >= text.size()) {
        return std::nullopt;
      }
      if (text[i] == ',') {
        i = json_skip_ws(text, i + 1);
        continue;
      }
      if (text[i] == '}') {
        ++i;
        break;
      }
      return std::nullopt;
    }
  }

  if (json_skip_ws(text, i) != text.size()) {
    return std::nullopt;
  }
  return object;
}

std::optional<std::string> json_string_field(const JsonObject &object, const std::string &key) {
  const auto it = object.find(key);
  if (it == object.end() || it->second.kind != JsonKind::String) {
    return std::nullopt;
  }
  return it->second.text;
}

std::optional<bool> json_bool_field(const JsonObject &object, const std::string &key) {
  const auto it = object.find(key);
  if (it == object.end() || it->second.kind != JsonKind::Bool) {
    return std::nullopt;
  }
  return it->second.text == "true";
}

std::string json_pretty_array(const std::vector<std::string> &raw_values) {
  if (raw_values.empty()) {
    return "[]";
  }
  std::ostringstream out;
  out << "[\n";
  for (std::size_t i = 0; i < raw_values.size(); ++i) {
    out << "  " << raw_values[i];
    if (i + 1 < raw_values.size()) {
      out << ",";
    }
    out << "\n";
  }
  out << "]";
  return out.str();
}

} // namespace gembridge::common
