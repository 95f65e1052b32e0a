#include <iostream>

void run_compile_benchmark();
void run_batch_benchmark();

int main() {
  std::cout << "traceops Benchmarks\n";
  run_compile_benchmark();
  run_batch_benchmark();
  return 0;
}
