#include <iostream>

void run_stream_benchmarks();
void run_state_benchmarks();
void run_shell_benchmark();
void run_config_benchmark();

int main() {
  std::cout << "Apiari Benchmarks\n";
  run_stream_benchmarks();
  run_state_benchmarks();
  run_shell_benchmark();
  run_config_benchmark();
  return 0;
}
