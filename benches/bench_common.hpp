#pragma once

#include <chrono>
#include <functional>
#include <iostream>
#include <string>

namespace recollect::bench {

/// Times `iterations` calls of `fn` and prints one line per bench. Benches
/// that do several stores or searches per call pass `ops_per_iteration` so
/// the reported rate is per operation.
inline void run_bench(const std::string &name, int iterations, const std::function<void()> &fn,
                      int ops_per_iteration = 1) {
  const auto start = std::chrono::steady_clock::now();
  for (int i = 0; i < iterations; ++i) {
    fn();
  }
  const auto end = std::chrono::steady_clock::now();
  const auto total =
      std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
  const double avg = static_cast<double>(total) / static_cast<double>(iterations);
  const double ops = static_cast<double>(iterations) * static_cast<double>(ops_per_iteration);
  const double ops_per_sec = total > 0 ? ops * 1e6 / static_cast<double>(total) : 0.0;
  std::cout << name << ": iterations=" << iterations << " total_us=" << total
            << " avg_us=" << avg << " ops_per_sec=" << ops_per_sec << "\n";
}

} // namespace recollect::bench
