#include "docgate/observability/global.hpp"
#include "docgate/observability/noop_observer.hpp"

#include <iostream>
#include <memory>

void run_content_benchmark();
void run_chunking_benchmark();

int main() {
  docgate::observability::set_global_observer(
      std::make_unique<docgate::observability::NoopObserver>());

  std::cout << "docgate benchmarks\n";
  run_content_benchmark();
  run_chunking_benchmark();
  return 0;
}
