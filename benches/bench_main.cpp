#include <iostream>

void run_interpreter_benchmark();
void run_config_benchmark();

int main() {
  std::cout << "gembridge benchmarks\n";
  run_interpreter_benchmark();
  run_config_benchmark();
  return 0;
}
