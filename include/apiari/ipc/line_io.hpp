#pragma once

#include "apiari/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace apiari::ipc {

/// Called once per complete line. `line` excludes the '\n'; `bytes` includes it.
using LineVisitor = std::function<void(const std::string &line, std::uint64_t bytes)>;

/// Current length of the stream file, or std::nullopt when it does not exist.
[[nodiscard]] common::Result<std::optional<std::uint64_t>>
stream_length(const std::filesystem::path &path);

/// Visits every newline-terminated line starting at `offset`. A trailing fragment without a
/// terminator is left unread. Failures opening, seeking or reading are ReadFailed.
[[nodiscard]] common::Status for_each_complete_line(const std::filesystem::path &path,
                                                    std::uint64_t offset,
                                                    const LineVisitor &visit);

/// Appends `line` plus '\n' in one write, creating parent directories and the file as needed.
[[nodiscard]] common::Status append_line(const std::filesystem::path &path,
                                         const std::string &line);

} // namespace apiari::ipc
