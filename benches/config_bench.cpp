#include "bench_common.hpp"

#include "apiari/config/config.hpp"

void run_config_benchmark() {
  apiari::bench::run_bench("config_validate", 2000, [] {
    apiari::config::Config config;
    (void)apiari::config::validate_config(config);
  });
}
