#include <iostream>

void run_memory_benchmark();
void run_config_benchmark();
void run_performance_benchmarks();

int main() {
  std::cout << "recollect benchmarks\n";
  run_config_benchmark();
  run_memory_benchmark();
  run_performance_benchmarks();
  return 0;
}
