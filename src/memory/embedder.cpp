#include "recollect/memory/embedder.hpp"

#include "recollect/common/fs.hpp"
#include "recollect/memory/embedder_local.hpp"
#include "recollect/memory/embedder_ollama.hpp"
#include "recollect/memory/embedder_openai.hpp"
#include "recollect/memory/embedding_cache.hpp"

namespace recollect::memory {

common::Result<std::unique_ptr<IEmbedder>>
create_embedder(const config::Config &config, const std::filesystem::path &cache_db) {
  using R = common::Result<std::unique_ptr<IEmbedder>>;
  const auto &embedding = config.embedding;
  const std::string provider = common::to_lower(embedding.provider);

  std::unique_ptr<IEmbedder> embedder;
  if (provider == "local") {
    embedder = std::make_unique<LocalEmbedder>(embedding.dimensions);
  } else if (provider == "openai") {
    embedder = std::make_unique<OpenAiEmbedder>(embedding.api_key.value_or(""), embedding.model,
                                                embedding.url, embedding.dimensions,
                                                embedding.timeout_ms);
  } else if (provider == "ollama") {
    embedder = std::make_unique<OllamaEmbedder>(embedding.model, embedding.url,
                                                embedding.dimensions, embedding.timeout_ms);
  } else {
    return R::failure(common::ErrorCode::Validation,
                      "unknown embedding provider: " + embedding.provider);
  }

  // The local provider is never cached.
  if (!embedding.cache_enabled || provider == "local") {
    return R::success(std::move(embedder));
  }

  auto cache = std::make_unique<EmbeddingCache>(cache_db, embedding.cache_size);
  if (auto status = cache->open(); !status.ok()) {
    return R::failure(status);
  }
  return R::success(std::make_unique<CachedEmbedder>(std::move(embedder), std::move(cache)));
}

} // namespace recollect::memory
