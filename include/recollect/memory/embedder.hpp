#pragma once

#include "recollect/common/result.hpp"
#include "recollect/config/schema.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace recollect::memory {

/// Text -> fixed-length vector. Remote failures are reported with
/// ErrorCode::EmbeddingUnavailable or ErrorCode::EmbeddingTimeout.
class IEmbedder {
public:
  virtual ~IEmbedder() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<float>> embed(std::string_view text) = 0;
  [[nodiscard]] virtual common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) = 0;
  [[nodiscard]] virtual std::size_t dimensions() const = 0;
};

/// Build the configured provider, wrapped in the persistent cache when
/// `embedding.cache_enabled` is set. `cache_db` is the cache's SQLite file.
[[nodiscard]] common::Result<std::unique_ptr<IEmbedder>>
create_embedder(const config::Config &config, const std::filesystem::path &cache_db);

} // namespace recollect::memory
