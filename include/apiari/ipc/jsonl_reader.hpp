#pragma once

#include "apiari/common/fs.hpp"
#include "apiari/common/json_codec.hpp"
#include "apiari/common/result.hpp"
#include "apiari/ipc/line_io.hpp"
#include "apiari/observability/global.hpp"

#include <cstdint>
#include <filesystem>
#include <utility>
#include <vector>

namespace apiari::ipc {

/// Cursor over a growing JSONL file. Each poll() returns only the records appended since
/// the previous poll; the byte offset always sits on a line boundary.
///
/// Lines that are blank or fail to decode are skipped but still consumed, so one bad line
/// never stalls the stream. A line without its trailing '\n' is left for a later poll.
///
/// The reader does not notice a file that was replaced by different content of equal or
/// greater length; a file shorter than the offset simply yields nothing.
///
/// Not thread-safe; the offset is plain instance state.
template <typename T> class JsonlReader {
public:
  explicit JsonlReader(std::filesystem::path path, const std::uint64_t offset = 0)
      : path_(std::move(path)), offset_(offset) {}

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  [[nodiscard]] std::uint64_t offset() const { return offset_; }

  /// No validation; the caller must supply a line-aligned offset.
  void set_offset(const std::uint64_t offset) { offset_ = offset; }

  /// Moves the cursor to the current end of file (0 when the file is missing).
  [[nodiscard]] common::Result<std::uint64_t> skip_to_end() {
    auto length = stream_length(path_);
    if (!length.ok()) {
      observability::record_error("ipc.reader", length.error());
      return common::Result<std::uint64_t>::failure(length.error(), length.kind());
    }
    offset_ = length.value().value_or(0);
    return common::Result<std::uint64_t>::success(offset_);
  }

  [[nodiscard]] common::Result<std::vector<T>> poll() {
    using PollResult = common::Result<std::vector<T>>;

    auto length = stream_length(path_);
    if (!length.ok()) {
      observability::record_error("ipc.reader", length.error());
      return PollResult::failure(length.error(), length.kind());
    }
    if (!length.value().has_value() || *length.value() <= offset_) {
      return PollResult::success({});
    }

    const std::uint64_t start_offset = offset_;
    std::vector<T> records;
    std::size_t skipped = 0;
    auto status = for_each_complete_line(
        path_, offset_, [&](const std::string &line, const std::uint64_t bytes) {
          offset_ += bytes;
          const std::string trimmed = common::trim(line);
          if (trimmed.empty()) {
            return;
          }
          auto decoded = common::decode_json<T>(trimmed);
          if (!decoded.ok()) {
            ++skipped;
            return;
          }
          records.push_back(std::move(decoded.value()));
        });
    if (!status.ok()) {
      // rewind so the lines read before the failure are delivered by the next poll
      offset_ = start_offset;
      observability::record_error("ipc.reader", status.error());
      return PollResult::failure(status.error(), status.kind());
    }

    if (offset_ != start_offset) {
      observability::record_stream_polled(path_.string(), records.size(), skipped, offset_);
    }
    return PollResult::success(std::move(records));
  }

private:
  std::filesystem::path path_;
  std::uint64_t offset_ = 0;
};

} // namespace apiari::ipc
