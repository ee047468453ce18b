#include "apiari/cli/commands.hpp"

#include "apiari/common/fs.hpp"
#include "apiari/common/json_util.hpp"
#include "apiari/config/config.hpp"
#include "apiari/ipc/jsonl_reader.hpp"
#include "apiari/ipc/jsonl_writer.hpp"
#include "apiari/ipc/raw_record.hpp"
#include "apiari/observability/factory.hpp"
#include "apiari/observability/global.hpp"
#include "apiari/shell/shell.hpp"
#include "apiari/state/state_store.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <iostream>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace apiari::cli {

namespace {

std::atomic<bool> g_interrupted{false};

void handle_interrupt(int) { g_interrupted = true; }

std::string version_string() {
#ifdef APIARI_VERSION
  std::string version = APIARI_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "apiari " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || args[i] == short_name) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

bool parse_u64(const std::string &text, std::uint64_t &out) {
  const std::string raw = common::trim(text);
  const auto *first = raw.data();
  const auto *last = first + raw.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return !raw.empty() && ec == std::errc() && ptr == last;
}

void print_error(const std::string &context, const common::Status &status) {
  std::cerr << context << ": " << common::error_kind_name(status.kind()) << ": "
            << status.error() << "\n";
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: apiari [--config PATH] <command> [options]\n\n";
  std::cout << "record streams\n";
  std::cout << "  tail <file> [--offset N] [--from-end] [--follow] [--max-polls N]\n";
  std::cout << "                      print records appended since the offset\n";
  std::cout << "  append <file> <json>  append one JSON record\n\n";
  std::cout << "state files\n";
  std::cout << "  state get <file>      print the stored value (null when missing)\n";
  std::cout << "  state set <file> <json>\n";
  std::cout << "                      atomically replace the stored value\n\n";
  std::cout << "shell text\n";
  std::cout << "  quote <words...>      single-quote each word for a POSIX shell\n";
  std::cout << "  sanitize <text...>    lowercase hyphenated token\n\n";
  std::cout << "misc\n";
  std::cout << "  config-path           print the config file location\n";
  std::cout << "  version               print the version\n";
}

int run_tail(std::vector<std::string> args, const config::Config &cfg) {
  std::string offset_value;
  const bool has_offset = take_option(args, "--offset", "-o", offset_value);
  std::string max_polls_value;
  const bool has_max_polls = take_option(args, "--max-polls", "-n", max_polls_value);
  const bool from_end = take_flag(args, "--from-end");
  const bool follow = take_flag(args, "--follow") || take_flag(args, "-f");
  if (args.size() != 1) {
    std::cerr << "usage: apiari tail <file> [--offset N] [--from-end] [--follow] "
                 "[--max-polls N]\n";
    return 1;
  }

  ipc::JsonlReader<ipc::RawRecord> reader(args[0]);
  if (has_offset) {
    std::uint64_t offset = 0;
    if (!parse_u64(offset_value, offset)) {
      std::cerr << "invalid --offset: " << offset_value << "\n";
      return 1;
    }
    reader.set_offset(offset);
  }
  std::uint64_t max_polls = 0;
  if (has_max_polls && !parse_u64(max_polls_value, max_polls)) {
    std::cerr << "invalid --max-polls: " << max_polls_value << "\n";
    return 1;
  }
  if (from_end) {
    auto end = reader.skip_to_end();
    if (!end.ok()) {
      print_error("tail", end.status());
      return 1;
    }
  }

  if (follow) {
    g_interrupted = false;
    std::signal(SIGINT, handle_interrupt);
  }

  std::uint64_t polls = 0;
  while (true) {
    auto batch = reader.poll();
    if (!batch.ok()) {
      print_error("tail", batch.status());
      return 1;
    }
    for (const auto &record : batch.value()) {
      std::cout << record.json << "\n";
    }
    std::cout.flush();
    ++polls;

    if (!follow || g_interrupted || (max_polls > 0 && polls >= max_polls)) {
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(cfg.stream.poll_interval_ms));
    if (g_interrupted) {
      break;
    }
  }

  std::cerr << "offset=" << reader.offset() << "\n";
  return 0;
}

int run_append(const std::vector<std::string> &args) {
  if (args.size() != 2) {
    std::cerr << "usage: apiari append <file> <json>\n";
    return 1;
  }
  ipc::JsonlWriter<ipc::RawRecord> writer(args[0]);
  auto appended = writer.append(ipc::RawRecord{.json = args[1]});
  if (!appended.ok()) {
    print_error("append", appended);
    return 1;
  }
  return 0;
}

int run_state(const std::vector<std::string> &args, const config::Config &cfg) {
  if (args.size() == 2 && args[0] == "get") {
    auto loaded = state::load_state<ipc::RawRecord>(args[1]);
    if (!loaded.ok()) {
      print_error("state get", loaded.status());
      return 1;
    }
    const std::string &json = loaded.value().json;
    std::cout << (json.empty() ? std::string("null") : common::json_pretty(json, cfg.state.indent))
              << "\n";
    return 0;
  }

  if (args.size() == 3 && args[0] == "set") {
    auto saved = state::save_state(args[1], ipc::RawRecord{.json = args[2]},
                                   state::state_options_from(cfg));
    if (!saved.ok()) {
      print_error("state set", saved);
      return 1;
    }
    return 0;
  }

  std::cerr << "usage: apiari state get <file> | apiari state set <file> <json>\n";
  return 1;
}

int run_quote(const std::vector<std::string> &args) {
  std::cout << shell::shell_join(args) << "\n";
  return 0;
}

int run_sanitize(const std::vector<std::string> &args, const config::Config &cfg) {
  if (args.empty()) {
    std::cerr << "usage: apiari sanitize <text...>\n";
    return 1;
  }
  std::cout << shell::sanitize(join_tokens(args), cfg.shell.sanitize_max_length) << "\n";
  return 0;
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argc > 0 ? argv + 1 : argv);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << "config: " << cfg.error() << "\n";
    return 1;
  }
  auto validation = config::validate_config(cfg.value());
  if (!validation.ok()) {
    std::cerr << "config: " << validation.error() << "\n";
    return 1;
  }
  for (const auto &warning : validation.value()) {
    std::cerr << "warning: " << warning << "\n";
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));

  if (subcommand == "tail") {
    return run_tail(std::move(args), cfg.value());
  }
  if (subcommand == "append") {
    return run_append(args);
  }
  if (subcommand == "state") {
    return run_state(args, cfg.value());
  }
  if (subcommand == "quote") {
    return run_quote(args);
  }
  if (subcommand == "sanitize") {
    return run_sanitize(args, cfg.value());
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace apiari::cli
