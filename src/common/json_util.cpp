#include "apiari/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace apiari::common {

namespace {

constexpr std::size_t kMaxNestingDepth = 512;

int hex_value(const char ch) {
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

bool parse_hex4(const std::string &text, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > text.size()) {
    return false;
  }
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const int digit = hex_value(text[i]);
    if (digit < 0) {
      return false;
    }
    value = (value << 4U) | static_cast<std::uint32_t>(digit);
  }
  out = value;
  return true;
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

class JsonValidator {
public:
  explicit JsonValidator(const std::string &text) : text_(text) {}

  bool run() {
    pos_ = json_skip_ws(text_, 0);
    if (!parse_value(0)) {
      return false;
    }
    pos_ = json_skip_ws(text_, pos_);
    return pos_ == text_.size();
  }

private:
  bool parse_value(const std::size_t depth) {
    if (depth > kMaxNestingDepth || pos_ >= text_.size()) {
      return false;
    }
    switch (text_[pos_]) {
    case '{':
      return parse_object(depth);
    case '[':
      return parse_array(depth);
    case '"':
      return parse_string();
    case 't':
      return parse_literal("true");
    case 'f':
      return parse_literal("false");
    case 'n':
      return parse_literal("null");
    default:
      return parse_number();
    }
  }

  bool parse_object(const std::size_t depth) {
    ++pos_;
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return true;
    }
    while (pos_ < text_.size()) {
      if (text_[pos_] != '"' || !parse_string()) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size() || text_[pos_] != ':') {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_ + 1);
      if (!parse_value(depth + 1)) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size()) {
        return false;
      }
      if (text_[pos_] == ',') {
        pos_ = json_skip_ws(text_, pos_ + 1);
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        return true;
      }
      return false;
    }
    return false;
  }

  bool parse_array(const std::size_t depth) {
    ++pos_;
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return true;
    }
    while (pos_ < text_.size()) {
      if (!parse_value(depth + 1)) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size()) {
        return false;
      }
      if (text_[pos_] == ',') {
        pos_ = json_skip_ws(text_, pos_ + 1);
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        return true;
      }
      return false;
    }
    return false;
  }

  bool parse_string() {
    ++pos_;
    while (pos_ < text_.size()) {
      const auto ch = static_cast<unsigned char>(text_[pos_]);
      if (ch == '"') {
        ++pos_;
        return true;
      }
      if (ch < 0x20) {
        return false;
      }
      if (ch != '\\') {
        ++pos_;
        continue;
      }
      if (++pos_ >= text_.size()) {
        return false;
      }
      const char esc = text_[pos_];
      if (esc == 'u') {
        std::uint32_t ignored = 0;
        if (!parse_hex4(text_, pos_ + 1, ignored)) {
          return false;
        }
        pos_ += 5;
        continue;
      }
      if (esc != '"' && esc != '\\' && esc != '/' && esc != 'b' && esc != 'f' && esc != 'n' &&
          esc != 'r' && esc != 't') {
        return false;
      }
      ++pos_;
    }
    return false;
  }

  bool parse_literal(const std::string &word) {
    if (text_.compare(pos_, word.size(), word) != 0) {
      return false;
    }
    pos_ += word.size();
    return true;
  }

  bool digit_at(const std::size_t pos) const {
    return pos < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos])) != 0;
  }

  bool parse_number() {
    if (pos_ < text_.size() && text_[pos_] == '-') {
      ++pos_;
    }
    if (!digit_at(pos_)) {
      return false;
    }
    if (text_[pos_] == '0') {
      ++pos_;
    } else {
      while (digit_at(pos_)) {
        ++pos_;
      }
    }
    if (pos_ < text_.size() && text_[pos_] == '.') {
      ++pos_;
      if (!digit_at(pos_)) {
        return false;
      }
      while (digit_at(pos_)) {
        ++pos_;
      }
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) {
        ++pos_;
      }
      if (!digit_at(pos_)) {
        return false;
      }
      while (digit_at(pos_)) {
        ++pos_;
      }
    }
    return true;
  }

  const std::string &text_;
  std::size_t pos_ = 0;
};

void append_newline_indent(std::string &out, const int indent, const std::size_t level) {
  out.push_back('\n');
  out.append(static_cast<std::size_t>(indent) * level, ' ');
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
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned char>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
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
      std::uint32_t cp = 0;
      if (!parse_hex4(raw, i + 1, cp)) {
        out.push_back(esc);
        break;
      }
      i += 4;
      if (cp >= 0xD800 && cp <= 0xDBFF && i + 6 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        std::uint32_t low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          cp = 0x10000 + ((cp - 0xD800) << 10U) + (low - 0xDC00);
          i += 6;
        }
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

std::size_t json_find_key(const std::string &json, const std::string &key, std::size_t from) {
  const std::string quoted = "\"" + key + "\"";
  return json.find(quoted, from);
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

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] != '"') {
    return "";
  }
  const auto end = json_find_string_end(json, pos);
  if (end == std::string::npos || end <= pos) {
    return "";
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] == '"') {
    return "";
  }
  const std::size_t start = pos;
  while (pos < json.size()) {
    const char ch = json[pos];
    if (ch == ',' || ch == '}' || ch == ']' || std::isspace(static_cast<unsigned char>(ch)) != 0) {
      break;
    }
    ++pos;
  }
  if (pos <= start) {
    return "";
  }
  return json.substr(start, pos - start);
}

std::string json_get_bool(const std::string &json, const std::string &field) {
  const std::string raw = json_get_number(json, field);
  if (raw == "true" || raw == "false") {
    return raw;
  }
  return "";
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] != '{') {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, '{', '}');
  if (end == std::string::npos || end < pos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] != '[') {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, '[', ']');
  if (end == std::string::npos || end < pos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

std::vector<std::string> json_get_string_array(const std::string &json, const std::string &field) {
  const std::string array_str = json_get_array(json, field);
  if (array_str.empty()) {
    return {};
  }

  std::vector<std::string> out;
  std::size_t pos = 1; // skip opening [
  while (pos < array_str.size()) {
    pos = json_skip_ws(array_str, pos);
    if (pos >= array_str.size() || array_str[pos] == ']') {
      break;
    }
    if (array_str[pos] == ',') {
      ++pos;
      continue;
    }
    if (array_str[pos] == '"') {
      const auto end = json_find_string_end(array_str, pos);
      if (end == std::string::npos || end <= pos) {
        break;
      }
      out.push_back(json_unescape(array_str.substr(pos + 1, end - pos - 1)));
      pos = end + 1;
    } else {
      ++pos;
    }
  }
  return out;
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  if (json.size() < 2 || json.front() != '{') {
    return result;
  }

  std::size_t pos = 1; // skip opening {
  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }

    if (json[pos] != '"') {
      ++pos;
      continue;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = key_end + 1;

    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] != ':') {
      break;
    }
    ++pos;
    pos = json_skip_ws(json, pos);
    if (pos >= json.size()) {
      break;
    }

    if (json[pos] == '"') {
      const auto val_end = json_find_string_end(json, pos);
      if (val_end == std::string::npos) {
        break;
      }
      result[key] = json_unescape(json.substr(pos + 1, val_end - pos - 1));
      pos = val_end + 1;
    } else if (json[pos] == '{' || json[pos] == '[') {
      const char open = json[pos];
      const char close = (open == '{') ? '}' : ']';
      const auto end = json_find_matching_token(json, pos, open, close);
      if (end == std::string::npos) {
        break;
      }
      result[key] = json.substr(pos, end - pos + 1);
      pos = end + 1;
    } else {
      // number, true, false, null
      const std::size_t start = pos;
      while (pos < json.size() && json[pos] != ',' && json[pos] != '}' && json[pos] != ']' &&
             std::isspace(static_cast<unsigned char>(json[pos])) == 0) {
        ++pos;
      }
      result[key] = json.substr(start, pos - start);
    }
  }

  return result;
}

bool json_is_valid(const std::string &text) { return JsonValidator(text).run(); }

std::string json_pretty(const std::string &json, const int indent) {
  if (!json_is_valid(json)) {
    return json;
  }

  std::string out;
  out.reserve(json.size() * 2);
  std::size_t level = 0;
  bool in_string = false;
  bool escaped = false;

  for (std::size_t i = 0; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      out.push_back(ch);
      if (escaped) {
        escaped = false;
      } else if (ch == '\\') {
        escaped = true;
      } else if (ch == '"') {
        in_string = false;
      }
      continue;
    }

    switch (ch) {
    case '"':
      in_string = true;
      out.push_back(ch);
      break;
    case '{':
    case '[': {
      const char close = ch == '{' ? '}' : ']';
      const std::size_t next = json_skip_ws(json, i + 1);
      if (next < json.size() && json[next] == close) {
        out.push_back(ch);
        out.push_back(close);
        i = next;
        break;
      }
      out.push_back(ch);
      ++level;
      if (indent > 0) {
        append_newline_indent(out, indent, level);
      }
      break;
    }
    case '}':
    case ']':
      --level;
      if (indent > 0) {
        append_newline_indent(out, indent, level);
      }
      out.push_back(ch);
      break;
    case ',':
      out.push_back(ch);
      if (indent > 0) {
        append_newline_indent(out, indent, level);
      }
      break;
    case ':':
      out.push_back(ch);
      if (indent > 0) {
        out.push_back(' ');
      }
      break;
    default:
      if (std::isspace(static_cast<unsigned char>(ch)) == 0) {
        out.push_back(ch);
      }
      break;
    }
  }
  return out;
}

} // namespace apiari::common
