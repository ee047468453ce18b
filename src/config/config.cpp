#include "apiari/config/config.hpp"

#include "apiari/common/fs.hpp"
#include "apiari/common/toml.hpp"
#include "apiari/state/state_store.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>

namespace apiari::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".apiari";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr int MAX_STATE_INDENT = 8;
constexpr std::uint64_t SLOW_POLL_INTERVAL_MS = 60'000;
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("APIARI_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

bool is_known_backend(const std::string &name) {
  return name == "none" || name == "noop" || name == "log";
}

std::string render_toml(const Config &config) {
  std::ostringstream out;
  out << "[stream]\n";
  out << "poll_interval_ms = " << config.stream.poll_interval_ms << "\n";
  out << "\n[state]\n";
  out << "indent = " << config.state.indent << "\n";
  out << "temp_suffix = " << common::quote_toml_string(config.state.temp_suffix) << "\n";
  out << "\n[shell]\n";
  out << "sanitize_max_length = " << config.shell.sanitize_max_length << "\n";
  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  return out.str();
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error(), home.kind());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error(), cfg_dir.kind());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *backend = std::getenv("APIARI_OBSERVABILITY"); backend != nullptr && *backend) {
    config.observability.backend = backend;
  }

  if (const char *interval = std::getenv("APIARI_POLL_INTERVAL_MS");
      interval != nullptr && *interval) {
    const std::string raw = common::trim(interval);
    std::uint64_t parsed = 0;
    const auto *first = raw.data();
    const auto *last = first + raw.size();
    auto [ptr, ec] = std::from_chars(first, last, parsed);
    if (ec == std::errc() && ptr == last) {
      config.stream.poll_interval_ms = parsed;
    }
  }
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error(), cfg_path_result.kind());
  }
  return load_config_from(cfg_path_result.value());
}

common::Result<Config> load_config_from(const std::filesystem::path &path) {
  Config config;

  auto text = state::read_state_text(path);
  if (!text.ok()) {
    return common::Result<Config>::failure(text.error(), text.kind());
  }
  if (!text.value().has_value()) {
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto parsed = common::parse_toml(*text.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error(), parsed.kind());
  }
  const auto &doc = parsed.value();

  config.stream.poll_interval_ms =
      doc.get_u64("stream.poll_interval_ms", config.stream.poll_interval_ms);
  config.state.indent = doc.get_int("state.indent", config.state.indent);
  config.state.temp_suffix = doc.get_string("state.temp_suffix", config.state.temp_suffix);
  config.shell.sanitize_max_length = static_cast<std::size_t>(
      doc.get_u64("shell.sanitize_max_length", config.shell.sanitize_max_length));
  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error(), cfg_path_result.kind());
  }
  return state::write_state_text(cfg_path_result.value(), render_toml(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using ValidationResult = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.stream.poll_interval_ms == 0) {
    return ValidationResult::failure("stream.poll_interval_ms must be at least 1",
                                     common::ErrorKind::InvalidArgument);
  }
  if (config.stream.poll_interval_ms > SLOW_POLL_INTERVAL_MS) {
    warnings.push_back("stream.poll_interval_ms is above one minute");
  }

  if (config.state.indent < 0 || config.state.indent > MAX_STATE_INDENT) {
    return ValidationResult::failure("state.indent must be between 0 and " +
                                         std::to_string(MAX_STATE_INDENT),
                                     common::ErrorKind::InvalidArgument);
  }
  if (config.state.temp_suffix.empty()) {
    return ValidationResult::failure("state.temp_suffix must not be empty",
                                     common::ErrorKind::InvalidArgument);
  }
  if (config.state.temp_suffix.find_first_of("/\\") != std::string::npos) {
    return ValidationResult::failure("state.temp_suffix must not contain path separators",
                                     common::ErrorKind::InvalidArgument);
  }

  if (config.shell.sanitize_max_length == 0) {
    return ValidationResult::failure("shell.sanitize_max_length must be at least 1",
                                     common::ErrorKind::InvalidArgument);
  }

  std::stringstream backends(common::to_lower(config.observability.backend));
  std::string part;
  while (std::getline(backends, part, ',')) {
    const std::string name = common::trim(part);
    if (!name.empty() && !is_known_backend(name)) {
      warnings.push_back("unknown observability backend '" + name + "'");
    }
  }

  return ValidationResult::success(std::move(warnings));
}

} // namespace apiari::config
