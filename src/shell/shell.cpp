#include "apiari/shell/shell.hpp"

namespace apiari::shell {

namespace {

/// Length of the UTF-8 sequence starting at `pos`, or 1 for stray bytes.
std::size_t utf8_sequence_length(const std::string &text, const std::size_t pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  std::size_t length = 1;
  if ((lead & 0xE0U) == 0xC0U) {
    length = 2;
  } else if ((lead & 0xF0U) == 0xE0U) {
    length = 3;
  } else if ((lead & 0xF8U) == 0xF0U) {
    length = 4;
  }
  if (pos + length > text.size()) {
    return 1;
  }
  for (std::size_t i = 1; i < length; ++i) {
    if ((static_cast<unsigned char>(text[pos + i]) & 0xC0U) != 0x80U) {
      return 1;
    }
  }
  return length;
}

bool is_ascii_alnum(const char ch) {
  return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9');
}

} // namespace

std::string shell_quote(const std::string &value) {
  std::string out = "'";
  for (const char ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string shell_join(const std::vector<std::string> &args) {
  std::string out;
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (i > 0) {
      out.push_back(' ');
    }
    out += shell_quote(args[i]);
  }
  return out;
}

std::string sanitize(const std::string &value, const std::size_t max_length) {
  // every output character is a single ASCII byte, so bytes == characters from here on
  std::string mapped;
  mapped.reserve(value.size());
  for (std::size_t pos = 0; pos < value.size();) {
    const char ch = value[pos];
    if (is_ascii_alnum(ch)) {
      mapped.push_back(ch >= 'A' && ch <= 'Z' ? static_cast<char>(ch - 'A' + 'a') : ch);
      ++pos;
      continue;
    }
    mapped.push_back('-');
    pos += utf8_sequence_length(value, pos);
  }

  const auto first = mapped.find_first_not_of('-');
  if (first == std::string::npos) {
    return "";
  }
  const auto last = mapped.find_last_not_of('-');
  std::string trimmed = mapped.substr(first, last - first + 1);
  if (trimmed.size() > max_length) {
    trimmed.resize(max_length);
  }
  return trimmed;
}

} // namespace apiari::shell
