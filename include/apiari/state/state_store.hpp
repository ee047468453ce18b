#pragma once

#include "apiari/common/json_codec.hpp"
#include "apiari/common/json_util.hpp"
#include "apiari/common/result.hpp"
#include "apiari/observability/global.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace apiari::config {
struct Config;
}

namespace apiari::state {

struct StateOptions {
  int indent = 2;
  std::string temp_suffix = ".tmp";
};

[[nodiscard]] StateOptions state_options_from(const config::Config &config);

/// Sibling file that receives the new content before it is renamed over `path`.
[[nodiscard]] std::filesystem::path temp_path_for(const std::filesystem::path &path,
                                                  const StateOptions &options = {});

/// Whole file content, or std::nullopt when the file does not exist.
[[nodiscard]] common::Result<std::optional<std::string>>
read_state_text(const std::filesystem::path &path);

/// Writes `text` to the temp sibling and renames it over `path`. On failure `path` keeps
/// its previous content.
[[nodiscard]] common::Status write_state_text(const std::filesystem::path &path,
                                              const std::string &text,
                                              const StateOptions &options = {});

/// Missing file yields T{}; undecodable content is CorruptState.
template <typename T> [[nodiscard]] common::Result<T> load_state(const std::filesystem::path &path) {
  auto text = read_state_text(path);
  if (!text.ok()) {
    observability::record_error("state.load", text.error());
    return common::Result<T>::failure(text.error(), text.kind());
  }
  if (!text.value().has_value()) {
    observability::record_state_loaded(path.string(), false);
    return common::Result<T>::success(T{});
  }

  auto decoded = common::decode_json<T>(*text.value());
  if (!decoded.ok()) {
    const std::string message = "corrupt state in " + path.string() + ": " + decoded.error();
    observability::record_error("state.load", message);
    return common::Result<T>::failure(message, common::ErrorKind::CorruptState);
  }
  observability::record_state_loaded(path.string(), true);
  return decoded;
}

template <typename T>
[[nodiscard]] common::Status save_state(const std::filesystem::path &path, const T &value,
                                        const StateOptions &options = {}) {
  auto encoded = common::encode_json(value);
  if (!encoded.ok()) {
    observability::record_error("state.save", encoded.error());
    return encoded.status();
  }

  const std::string text = common::json_pretty(encoded.value(), options.indent) + "\n";
  auto status = write_state_text(path, text, options);
  if (!status.ok()) {
    observability::record_error("state.save", status.error());
    return status;
  }
  observability::record_state_saved(path.string(), text.size());
  return common::Status::success();
}

} // namespace apiari::state
