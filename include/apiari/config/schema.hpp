#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace apiari::config {

struct StreamConfig {
  std::uint64_t poll_interval_ms = 500;
};

struct StateConfig {
  int indent = 2;
  std::string temp_suffix = ".tmp";
};

struct ShellConfig {
  std::size_t sanitize_max_length = 40;
};

struct ObservabilityConfig {
  std::string backend = "none";
};

struct Config {
  StreamConfig stream;
  StateConfig state;
  ShellConfig shell;
  ObservabilityConfig observability;
};

} // namespace apiari::config
