#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace recollect::config {

struct ServerConfig {
  std::string host = "127.0.0.1";
  std::uint16_t port = 8741;
  std::size_t worker_threads = 8;
  std::size_t max_body_bytes = 1024 * 1024;
};

struct StoreConfig {
  std::string data_dir = "~/.recollect/data";
  double admission_threshold = 0.70;
  std::uint32_t unhealthy_after_failures = 3;
};

struct EmbeddingConfig {
  std::string provider = "local";
  std::string model = "text-embedding-3-small";
  std::string url;
  std::optional<std::string> api_key;
  std::size_t dimensions = 384;
  std::uint64_t timeout_ms = 5000;
  bool include_context = false;
  bool cache_enabled = true;
  std::size_t cache_size = 10'000;
};

struct DedupConfig {
  double similarity_threshold = 0.92;
  bool merge_context = true;
  bool refresh_session_source = false;
  std::uint64_t lock_timeout_ms = 2000;
};

struct QueryConfig {
  std::size_t default_k = 5;
  std::size_t max_k = 100;
  std::size_t oversample = 3;
  double similarity_weight = 0.7;
  double confidence_weight = 0.3;
};

struct IndexConfig {
  std::uint64_t snapshot_interval_secs = 60;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct Config {
  ServerConfig server;
  StoreConfig store;
  EmbeddingConfig embedding;
  DedupConfig dedup;
  QueryConfig query;
  IndexConfig index;
  ObservabilityConfig observability;
};

} // namespace recollect::config
