#include "bench_common.hpp"

#include "recollect/config/config.hpp"

void run_config_benchmark() {
  recollect::bench::run_bench("config_validate", 2000, [] {
    recollect::config::Config config;
    (void)recollect::config::validate_config(config);
  });

  const std::string toml = "[server]\nport = 9000\n[dedup]\nsimilarity_threshold = 0.9\n"
                           "[query]\ndefault_k = 8\n";
  recollect::bench::run_bench("config_parse", 2000,
                              [&] { (void)recollect::config::parse_config(toml); });
}
