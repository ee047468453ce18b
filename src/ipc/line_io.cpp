#include "apiari/ipc/line_io.hpp"

#include "apiari/common/fs.hpp"

#include <fstream>

namespace apiari::ipc {

common::Result<std::optional<std::uint64_t>> stream_length(const std::filesystem::path &path) {
  using LengthResult = common::Result<std::optional<std::uint64_t>>;

  std::error_code ec;
  const auto status = std::filesystem::status(path, ec);
  if (status.type() == std::filesystem::file_type::not_found) {
    return LengthResult::success(std::nullopt);
  }
  if (ec) {
    return LengthResult::failure("failed to stat " + path.string() + ": " + ec.message(),
                                 common::ErrorKind::ReadFailed);
  }

  const auto size = std::filesystem::file_size(path, ec);
  if (ec) {
    return LengthResult::failure("failed to read length of " + path.string() + ": " +
                                     ec.message(),
                                 common::ErrorKind::ReadFailed);
  }
  return LengthResult::success(static_cast<std::uint64_t>(size));
}

common::Status for_each_complete_line(const std::filesystem::path &path,
                                      const std::uint64_t offset, const LineVisitor &visit) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return common::Status::error("failed to open " + path.string(),
                                 common::ErrorKind::ReadFailed);
  }
  in.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
  if (!in) {
    return common::Status::error("failed to seek " + path.string() + " to offset " +
                                     std::to_string(offset),
                                 common::ErrorKind::ReadFailed);
  }

  std::string line;
  while (std::getline(in, line)) {
    if (in.eof()) {
      // unterminated tail: the writer has not finished this line yet
      break;
    }
    visit(line, static_cast<std::uint64_t>(line.size()) + 1);
  }
  if (in.bad()) {
    return common::Status::error("failed reading " + path.string(),
                                 common::ErrorKind::ReadFailed);
  }
  return common::Status::success();
}

common::Status append_line(const std::filesystem::path &path, const std::string &line) {
  auto dir = common::ensure_parent_dir(path, common::ErrorKind::Io);
  if (!dir.ok()) {
    return dir;
  }

  std::ofstream out(path, std::ios::app | std::ios::binary);
  if (!out) {
    return common::Status::error("failed opening " + path.string() + " for append",
                                 common::ErrorKind::Io);
  }

  std::string buffer;
  buffer.reserve(line.size() + 1);
  buffer += line;
  buffer.push_back('\n');
  out.write(buffer.data(), static_cast<std::streamsize>(buffer.size()));
  out.close();
  if (!out) {
    return common::Status::error("failed appending to " + path.string(), common::ErrorKind::Io);
  }
  return common::Status::success();
}

} // namespace apiari::ipc
