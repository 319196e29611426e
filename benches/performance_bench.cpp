#include "bench_common.hpp"

#include "recollect/memory/embedder_local.hpp"
#include "recollect/memory/similarity_index.hpp"

#include <thread>
#include <vector>

void run_performance_benchmarks() {
  namespace mem = recollect::memory;
  std::cout << "\n=== Similarity Index ===\n";

  mem::LocalEmbedder embedder;
  mem::SimilarityIndex index(embedder.dimensions());
  for (int i = 0; i < 10'000; ++i) {
    auto embedding = embedder.embed("learning number " + std::to_string(i) + " topic " +
                                    std::to_string(i % 97));
    if (!embedding.ok()) {
      return;
    }
    (void)index.upsert("lrn_" + std::to_string(i), embedding.value(),
                       mem::kAllLearningTypes[static_cast<std::size_t>(i) %
                                              mem::kAllLearningTypes.size()],
                       "2026-01-01T00:00:00.000Z", "2026-01-01T00:00:00.000Z");
  }

  auto probe = embedder.embed("topic 42");
  if (!probe.ok()) {
    return;
  }

  recollect::bench::run_bench("index_search_10k", 200,
                              [&] { (void)index.search(probe.value(), 15, -1.0); });

  recollect::bench::run_bench("index_search_10k_typed", 200, [&] {
    (void)index.search(probe.value(), 15, 0.5, mem::LearningType::Gotcha);
  });

  constexpr int kSearchThreads = 4;
  constexpr int kSearchesPerThread = 10;
  recollect::bench::run_bench(
      "index_concurrent_search_10k", 20,
      [&] {
        std::vector<std::thread> threads;
        for (int t = 0; t < kSearchThreads; ++t) {
          threads.emplace_back([&] {
            for (int j = 0; j < kSearchesPerThread; ++j) {
              (void)index.search(probe.value(), 5, -1.0);
            }
          });
        }
        for (auto &thread : threads) {
          thread.join();
        }
      },
      kSearchThreads * kSearchesPerThread);
}
