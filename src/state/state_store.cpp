#include "apiari/state/state_store.hpp"

#include "apiari/common/fs.hpp"
#include "apiari/config/schema.hpp"

#include <fstream>
#include <sstream>

namespace apiari::state {

StateOptions state_options_from(const config::Config &config) {
  StateOptions options;
  options.indent = config.state.indent;
  options.temp_suffix = config.state.temp_suffix;
  return options;
}

std::filesystem::path temp_path_for(const std::filesystem::path &path,
                                    const StateOptions &options) {
  std::filesystem::path tmp = path;
  tmp += options.temp_suffix.empty() ? std::string(".tmp") : options.temp_suffix;
  return tmp;
}

common::Result<std::optional<std::string>> read_state_text(const std::filesystem::path &path) {
  using TextResult = common::Result<std::optional<std::string>>;

  std::error_code ec;
  const auto status = std::filesystem::status(path, ec);
  if (status.type() == std::filesystem::file_type::not_found) {
    return TextResult::success(std::nullopt);
  }
  if (ec) {
    return TextResult::failure("failed to stat " + path.string() + ": " + ec.message(),
                               common::ErrorKind::ReadFailed);
  }
  if (std::filesystem::is_directory(status)) {
    return TextResult::failure(path.string() + " is a directory", common::ErrorKind::ReadFailed);
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return TextResult::failure("failed to open " + path.string(), common::ErrorKind::ReadFailed);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return TextResult::failure("failed reading " + path.string(), common::ErrorKind::ReadFailed);
  }
  return TextResult::success(buffer.str());
}

common::Status write_state_text(const std::filesystem::path &path, const std::string &text,
                                const StateOptions &options) {
  auto dir = common::ensure_parent_dir(path, common::ErrorKind::WriteFailed);
  if (!dir.ok()) {
    return dir;
  }

  const auto tmp = temp_path_for(path, options);
  std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
  if (!out) {
    return common::Status::error("failed to open temporary state file " + tmp.string(),
                                 common::ErrorKind::WriteFailed);
  }
  out.write(text.data(), static_cast<std::streamsize>(text.size()));
  out.close();

  std::error_code ec;
  if (!out) {
    std::filesystem::remove(tmp, ec);
    return common::Status::error("failed writing temporary state file " + tmp.string(),
                                 common::ErrorKind::WriteFailed);
  }

  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    const std::string message = "failed replacing " + path.string() + ": " + ec.message();
    std::filesystem::remove(tmp, ec);
    return common::Status::error(message, common::ErrorKind::WriteFailed);
  }
  return common::Status::success();
}

} // namespace apiari::state
