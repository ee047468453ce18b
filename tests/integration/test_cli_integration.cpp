#include "test_framework.hpp"

#include "apiari/cli/commands.hpp"
#include "apiari/config/config.hpp"
#include "apiari/observability/global.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace {

using apiari::testing::StreamCapture;
using apiari::testing::TempWorkspace;

struct CliRun {
  int code = 0;
  std::string out;
  std::string err;
};

/// Runs the CLI against a config file inside `ws` so the user's real config is never read.
CliRun run_cli(const TempWorkspace &ws, const std::vector<std::string> &args) {
  std::vector<std::string> owned;
  owned.reserve(args.size() + 3);
  owned.emplace_back("apiari");
  owned.emplace_back("--config");
  owned.push_back((ws.path() / "config.toml").string());
  owned.insert(owned.end(), args.begin(), args.end());

  std::vector<char *> argv;
  argv.reserve(owned.size());
  for (auto &arg : owned) {
    argv.push_back(arg.data());
  }

  CliRun run;
  {
    StreamCapture out(std::cout);
    StreamCapture err(std::cerr);
    run.code = apiari::cli::run_cli(static_cast<int>(argv.size()), argv.data());
    run.out = out.text();
    run.err = err.text();
  }
  apiari::config::clear_config_path_override();
  apiari::observability::set_global_observer(nullptr);
  return run;
}

} // namespace

void register_cli_integration_tests(std::vector<apiari::tests::TestCase> &tests) {
  using apiari::tests::require;
  using apiari::testing::EnvGuard;

  tests.push_back({"cli_append_then_tail", [] {
                     TempWorkspace ws;
                     EnvGuard backend("APIARI_OBSERVABILITY", std::nullopt);
                     const std::string file = (ws.path() / "events.jsonl").string();

                     auto first = run_cli(ws, {"append", file, "{ \"kind\": \"start\" }"});
                     require(first.code == 0, "append failed: " + first.err);
                     auto second = run_cli(ws, {"append", file, "{\"kind\":\"stop\"}"});
                     require(second.code == 0, "append failed: " + second.err);

                     auto tail = run_cli(ws, {"tail", file});
                     require(tail.code == 0, "tail failed: " + tail.err);
                     require(tail.out == "{\"kind\":\"start\"}\n{\"kind\":\"stop\"}\n",
                             "tail output mismatch: " + tail.out);
                     require(tail.err.find("offset=33") != std::string::npos,
                             "tail should report the offset: " + tail.err);

                     auto resumed = run_cli(ws, {"tail", file, "--offset", "17"});
                     require(resumed.code == 0, resumed.err);
                     require(resumed.out == "{\"kind\":\"stop\"}\n", "resume output mismatch");
                   }});

  tests.push_back({"cli_tail_from_end_prints_nothing", [] {
                     TempWorkspace ws;
                     const std::string file = (ws.path() / "events.jsonl").string();
                     require(run_cli(ws, {"append", file, "[1,2,3]"}).code == 0, "append");
                     auto tail = run_cli(ws, {"tail", file, "--from-end"});
                     require(tail.code == 0, tail.err);
                     require(tail.out.empty(), "history should be skipped");
                     require(tail.err.find("offset=8") != std::string::npos, "end offset");
                   }});

  tests.push_back({"cli_append_rejects_invalid_json", [] {
                     TempWorkspace ws;
                     const auto file = ws.path() / "events.jsonl";
                     auto run = run_cli(ws, {"append", file.string(), "{broken"});
                     require(run.code == 1, "invalid JSON should fail");
                     require(run.err.find("encode error") != std::string::npos,
                             "error kind should be printed: " + run.err);
                     require(!std::filesystem::exists(file), "nothing written");
                   }});

  tests.push_back({"cli_state_set_and_get", [] {
                     TempWorkspace ws;
                     const std::string file = (ws.path() / "state" / "hive.json").string();

                     auto missing = run_cli(ws, {"state", "get", file});
                     require(missing.code == 0, missing.err);
                     require(missing.out == "null\n", "missing state prints null");

                     auto set = run_cli(ws, {"state", "set", file, "{\"workers\":[\"a\"]}"});
                     require(set.code == 0, set.err);
                     require(apiari::testing::read_file(file) ==
                                 "{\n  \"workers\": [\n    \"a\"\n  ]\n}\n",
                             "state file content mismatch");

                     auto get = run_cli(ws, {"state", "get", file});
                     require(get.code == 0, get.err);
                     require(get.out == "{\n  \"workers\": [\n    \"a\"\n  ]\n}\n",
                             "get output mismatch: " + get.out);
                   }});

  tests.push_back({"cli_state_get_reports_corruption", [] {
                     TempWorkspace ws;
                     ws.create_file("bad.json", "{oops");
                     auto run = run_cli(ws, {"state", "get", (ws.path() / "bad.json").string()});
                     require(run.code == 1, "corrupt state should fail");
                     require(run.err.find("corrupt state") != std::string::npos, run.err);
                   }});

  tests.push_back({"cli_quote_and_sanitize", [] {
                     TempWorkspace ws;
                     auto quoted = run_cli(ws, {"quote", "echo", "it's here"});
                     require(quoted.code == 0, quoted.err);
                     require(quoted.out == "'echo' 'it'\\''s here'\n", "quote output");

                     auto sanitized = run_cli(ws, {"sanitize", "Fix", "Login", "Bug!"});
                     require(sanitized.code == 0, sanitized.err);
                     require(sanitized.out == "fix-login-bug\n", "sanitize output");
                   }});

  tests.push_back({"cli_config_controls_sanitize_length", [] {
                     TempWorkspace ws;
                     ws.create_file("config.toml", "[shell]\nsanitize_max_length = 6\n");
                     auto run = run_cli(ws, {"sanitize", "Refactor Everything"});
                     require(run.code == 0, run.err);
                     require(run.out == "refact\n", "configured limit: " + run.out);
                   }});

  tests.push_back({"cli_invalid_config_fails", [] {
                     TempWorkspace ws;
                     ws.create_file("config.toml", "[stream]\npoll_interval_ms = 0\n");
                     EnvGuard interval("APIARI_POLL_INTERVAL_MS", std::nullopt);
                     auto run = run_cli(ws, {"quote", "x"});
                     require(run.code == 1, "invalid config should fail");
                     require(run.err.find("poll_interval_ms") != std::string::npos, run.err);
                   }});

  tests.push_back({"cli_unknown_command", [] {
                     TempWorkspace ws;
                     auto run = run_cli(ws, {"swarm"});
                     require(run.code == 1, "unknown command should fail");
                     require(run.err.find("Unknown command: swarm") != std::string::npos,
                             run.err);
                   }});

  tests.push_back({"cli_version_and_config_path", [] {
                     TempWorkspace ws;
                     auto version = run_cli(ws, {"version"});
                     require(version.code == 0, version.err);
                     require(version.out.rfind("apiari ", 0) == 0, "version prefix");

                     auto path = run_cli(ws, {"config-path"});
                     require(path.code == 0, path.err);
                     require(path.out == (ws.path() / "config.toml").string() + "\n",
                             "config path output: " + path.out);
                   }});
}
