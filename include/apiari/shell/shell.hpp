#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace apiari::shell {

inline constexpr std::size_t kDefaultSanitizeLength = 40;

/// Single-quote `value` for a POSIX shell; embedded quotes become '\''.
[[nodiscard]] std::string shell_quote(const std::string &value);

/// Quote every argument and join them with single spaces.
[[nodiscard]] std::string shell_join(const std::vector<std::string> &args);

/// Lowercased token safe for branch and directory names: every character other than an
/// ASCII letter or digit becomes '-', leading/trailing '-' are stripped, and the result is
/// cut to `max_length` characters. Input is read as UTF-8, one replacement per code point.
[[nodiscard]] std::string sanitize(const std::string &value,
                                   std::size_t max_length = kDefaultSanitizeLength);

} // namespace apiari::shell
