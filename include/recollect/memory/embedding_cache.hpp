#pragma once

#include "recollect/common/result.hpp"
#include "recollect/memory/embedder.hpp"

#include <sqlite3.h>

#include <atomic>
#include <filesystem>
#include <mutex>
#include <optional>

namespace recollect::memory {

struct EmbeddingCacheStats {
  std::size_t entries = 0;
  std::size_t hits = 0;
  std::size_t misses = 0;
};

/// Persistent text -> embedding cache keyed by SHA-256, trimmed oldest-first
/// to `capacity` entries.
class EmbeddingCache {
public:
  EmbeddingCache(std::filesystem::path db_path, std::size_t capacity);
  ~EmbeddingCache();

  EmbeddingCache(const EmbeddingCache &) = delete;
  EmbeddingCache &operator=(const EmbeddingCache &) = delete;

  [[nodiscard]] common::Status open();
  [[nodiscard]] common::Result<std::optional<std::vector<float>>> get(const std::string &key);
  [[nodiscard]] common::Status put(const std::string &key, const std::vector<float> &embedding);
  [[nodiscard]] EmbeddingCacheStats stats() const;

private:
  std::filesystem::path db_path_;
  std::size_t capacity_;
  sqlite3 *db_ = nullptr;
  mutable std::mutex mutex_;
  EmbeddingCacheStats stats_;
};

/// Decorator consulting an EmbeddingCache before the wrapped embedder.
class CachedEmbedder final : public IEmbedder {
public:
  CachedEmbedder(std::unique_ptr<IEmbedder> inner, std::unique_ptr<EmbeddingCache> cache);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override;

  [[nodiscard]] const EmbeddingCache &cache() const { return *cache_; }

private:
  [[nodiscard]] std::string cache_key(std::string_view text) const;

  std::unique_ptr<IEmbedder> inner_;
  std::unique_ptr<EmbeddingCache> cache_;
};

} // namespace recollect::memory
