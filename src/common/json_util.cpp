#include "traceops/common/json_util.hpp"

#include <cctype>
#include <charconv>
#include <cmath>
#include <cstdlib>

namespace traceops::common {

namespace {

int hex_digit(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

std::optional<std::uint32_t> parse_hex4(const std::string &raw, const std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const int digit = hex_digit(raw[i]);
    if (digit < 0) {
      return std::nullopt;
    }
    value = (value << 4U) | static_cast<std::uint32_t>(digit);
  }
  return value;
}

void append_utf8(std::string &out, const std::uint32_t cp) {
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

bool is_literal_char(const char ch) {
  return ch != ',' && ch != '}' && ch != ']' && ch != ':' &&
         std::isspace(static_cast<unsigned char>(ch)) == 0;
}

} // namespace

std::string json_escape(const std::string &value) {
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
    default:
      escaped.push_back(ch);
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
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
      auto cp = parse_hex4(raw, i + 1);
      if (!cp.has_value()) {
        out.push_back(next);
        break;
      }
      i += 4;
      // Surrogate pair
      if (*cp >= 0xD800 && *cp <= 0xDBFF && i + 6 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        const auto low = parse_hex4(raw, i + 3);
        if (low.has_value() && *low >= 0xDC00 && *low <= 0xDFFF) {
          *cp = 0x10000 + ((*cp - 0xD800) << 10U) + (*low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, *cp);
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::size_t json_value_end(const std::string &json, const std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const auto end = json_find_matching_token(json, pos, ch, ch == '{' ? '}' : ']');
    return end == std::string::npos ? end : end + 1;
  }
  std::size_t end = pos;
  while (end < json.size() && is_literal_char(json[end])) {
    ++end;
  }
  return end == pos ? std::string::npos : end;
}

std::optional<JsonMembers> json_object_members(const std::string &object_json) {
  std::size_t pos = json_skip_ws(object_json, 0);
  if (pos >= object_json.size() || object_json[pos] != '{') {
    return std::nullopt;
  }
  ++pos;

  JsonMembers members;
  while (true) {
    pos = json_skip_ws(object_json, pos);
    if (pos >= object_json.size()) {
      return std::nullopt;
    }
    if (object_json[pos] == '}') {
      break;
    }
    if (!members.empty()) {
      if (object_json[pos] != ',') {
        return std::nullopt;
      }
      pos = json_skip_ws(object_json, pos + 1);
    }
    if (pos >= object_json.size() || object_json[pos] != '"') {
      return std::nullopt;
    }
    const auto key_end = json_find_string_end(object_json, pos);
    if (key_end == std::string::npos) {
      return std::nullopt;
    }
    std::string key = json_unescape(object_json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(object_json, key_end + 1);
    if (pos >= object_json.size() || object_json[pos] != ':') {
      return std::nullopt;
    }
    pos = json_skip_ws(object_json, pos + 1);
    const auto value_end = json_value_end(object_json, pos);
    if (value_end == std::string::npos) {
      return std::nullopt;
    }
    members.emplace_back(std::move(key), object_json.substr(pos, value_end - pos));
    pos = value_end;
  }

  return members;
}

std::optional<std::vector<std::string>> json_array_elements(const std::string &array_json) {
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return std::nullopt;
  }
  ++pos;

  std::vector<std::string> out;
  while (true) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size()) {
      return std::nullopt;
    }
    if (array_json[pos] == ']') {
      break;
    }
    if (!out.empty()) {
      if (array_json[pos] != ',') {
        return std::nullopt;
      }
      pos = json_skip_ws(array_json, pos + 1);
    }
    const auto end = json_value_end(array_json, pos);
    if (end == std::string::npos) {
      return std::nullopt;
    }
    out.push_back(array_json.substr(pos, end - pos));
    pos = end;
  }
  return out;
}

std::string json_get_raw(const std::string &json, const std::string &field) {
  const auto members = json_object_members(json);
  if (!members.has_value()) {
    return "";
  }
  for (const auto &[key, value] : *members) {
    if (key == field) {
      return value;
    }
  }
  return "";
}

std::string json_get_string(const std::string &json, const std::string &field) {
  return json_string_value(json_get_raw(json, field)).value_or("");
}

std::optional<std::int64_t> json_get_int(const std::string &json, const std::string &field) {
  return json_int_value(json_get_raw(json, field));
}

std::string json_get_object(const std::string &json, const std::string &field) {
  std::string raw = json_get_raw(json, field);
  return json_is_object(raw) ? raw : "";
}

bool json_is_string(const std::string &raw) {
  return raw.size() >= 2 && raw.front() == '"' && raw.back() == '"';
}

bool json_is_object(const std::string &raw) {
  return raw.size() >= 2 && raw.front() == '{' && raw.back() == '}';
}

std::optional<std::string> json_string_value(const std::string &raw) {
  if (!json_is_string(raw)) {
    return std::nullopt;
  }
  return json_unescape(raw.substr(1, raw.size() - 2));
}

std::optional<std::int64_t> json_int_value(const std::string &raw) {
  if (raw.empty() || json_is_string(raw)) {
    return std::nullopt;
  }
  std::int64_t parsed = 0;
  const auto *first = raw.data();
  const auto *last = first + raw.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec == std::errc() && ptr == last) {
    return parsed;
  }
  // Exponent or fraction: fall back to floating point.
  char *end = nullptr;
  const double value = std::strtod(raw.c_str(), &end);
  if (end != raw.c_str() + raw.size() || !std::isfinite(value)) {
    return std::nullopt;
  }
  // 2^63 is exact as a double; anything at or beyond it does not fit.
  constexpr double kInt64Bound = 9223372036854775808.0;
  if (value < -kInt64Bound || value >= kInt64Bound) {
    return std::nullopt;
  }
  return static_cast<std::int64_t>(value);
}

std::string json_minify(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  bool in_string = false;
  bool escaped = false;
  for (const char ch : raw) {
    if (in_string) {
      out.push_back(ch);
      if (!escaped && ch == '"') {
        in_string = false;
      }
      escaped = !escaped && ch == '\\';
      continue;
    }
    if (ch == '"') {
      in_string = true;
      out.push_back(ch);
      continue;
    }
    if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
      continue;
    }
    out.push_back(ch);
  }
  return out;
}

} // namespace traceops::common
