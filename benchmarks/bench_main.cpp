// Main entry point for benchmarks
// Google Benchmark automatically discovers and runs all BENCHMARK() macros

#include <benchmark/benchmark.h>

// Benchmark execution is handled by Google Benchmark's main()
BENCHMARK_MAIN();
