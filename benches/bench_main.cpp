#include <iostream>

void run_id_generator_benchmark();
void run_create_session_benchmark();

int main() {
  std::cout << "sessionkit benchmarks\n";
  run_id_generator_benchmark();
  run_create_session_benchmark();
  return 0;
}
