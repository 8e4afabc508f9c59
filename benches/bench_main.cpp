#include <iostream>

void run_sanitize_benchmark();
void run_rate_limit_benchmark();
void run_config_benchmark();

int main() {
  std::cout << "toolshield benchmarks\n";
  run_sanitize_benchmark();
  run_rate_limit_benchmark();
  run_config_benchmark();
  return 0;
}
