#include <iostream>

void run_validators_benchmark();
void run_guard_benchmark();

int main() {
  std::cout << "llmshield Benchmarks\n";
  run_validators_benchmark();
  run_guard_benchmark();
  return 0;
}
