#include "bench_common.hpp"

#include "apiari/ipc/raw_record.hpp"
#include "apiari/state/state_store.hpp"

#include <filesystem>
#include <random>

void run_state_benchmarks() {
  namespace ipc = apiari::ipc;
  static std::mt19937_64 rng{std::random_device{}()};
  const auto dir =
      std::filesystem::temp_directory_path() / ("apiari-state-bench-" + std::to_string(rng()));
  const auto file = dir / "state.json";

  const ipc::RawRecord state{
      .json = R"({"workers":[{"id":"w-1","branch":"fix-login"},{"id":"w-2","branch":"docs"}],)"
              R"("cursor":4096})"};
  apiari::bench::run_bench("state_save", 500, [&] {
    if (!apiari::state::save_state(file, state).ok()) {
      std::cerr << "save failed\n";
    }
  });
  apiari::bench::run_bench("state_load", 2000, [&] {
    (void)apiari::state::load_state<ipc::RawRecord>(file);
  });

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}
