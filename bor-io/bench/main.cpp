#include <benchmark/benchmark.h>

#include "util.hpp"

int main(int argc, char** argv) {
  benchmark::Initialize(&argc, argv);

  ReadBenchmarkReporter reporter;
  benchmark::RunSpecifiedBenchmarks(&reporter);
  benchmark::Shutdown();

  return 0;
}
