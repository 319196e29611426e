#pragma once

#include "recollect/common/http_client.hpp"
#include "recollect/memory/embedder.hpp"

namespace recollect::memory {

/// Ollama `POST {base}/api/embeddings`, one prompt per request.
class OllamaEmbedder final : public IEmbedder {
public:
  OllamaEmbedder(std::string model, std::string base_url, std::size_t dimensions,
                 std::uint64_t timeout_ms,
                 std::shared_ptr<common::HttpClient> http_client =
                     std::make_shared<common::CurlHttpClient>());

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::string model_;
  std::string endpoint_;
  std::size_t dimensions_;
  std::uint64_t timeout_ms_;
  std::shared_ptr<common::HttpClient> http_client_;
};

} // namespace recollect::memory
