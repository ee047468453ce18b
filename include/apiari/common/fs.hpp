#pragma once

#include "apiari/common/result.hpp"
#include <filesystem>
#include <string>

namespace apiari::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] Status ensure_parent_dir(const std::filesystem::path &file_path,
                                       ErrorKind kind = ErrorKind::Io);
[[nodiscard]] std::string expand_path(std::string value);

} // namespace apiari::common
