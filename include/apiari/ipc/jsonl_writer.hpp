#pragma once

#include "apiari/common/json_codec.hpp"
#include "apiari/common/result.hpp"
#include "apiari/ipc/line_io.hpp"
#include "apiari/observability/global.hpp"

#include <filesystem>
#include <utility>

namespace apiari::ipc {

/// Appends one JSON record per line. Every append opens, writes and closes the file;
/// nothing is cached between calls. Appends from several processes are not coordinated.
template <typename T> class JsonlWriter {
public:
  explicit JsonlWriter(std::filesystem::path path) : path_(std::move(path)) {}

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

  [[nodiscard]] common::Status append(const T &record) const {
    auto encoded = common::encode_json(record);
    if (!encoded.ok()) {
      observability::record_error("ipc.writer", encoded.error());
      return encoded.status();
    }

    auto status = append_line(path_, encoded.value());
    if (!status.ok()) {
      observability::record_error("ipc.writer", status.error());
      return status;
    }
    observability::record_stream_appended(path_.string(), encoded.value().size() + 1);
    return common::Status::success();
  }

private:
  std::filesystem::path path_;
};

} // namespace apiari::ipc
