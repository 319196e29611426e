#pragma once

#include "recollect/common/http_client.hpp"
#include "recollect/memory/embedder.hpp"

namespace recollect::memory {

/// OpenAI-compatible `POST {base}/v1/embeddings`.
class OpenAiEmbedder final : public IEmbedder {
public:
  OpenAiEmbedder(std::string api_key, std::string model, std::string base_url,
                 std::size_t dimensions, std::uint64_t timeout_ms,
                 std::shared_ptr<common::HttpClient> http_client =
                     std::make_shared<common::CurlHttpClient>());

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::string api_key_;
  std::string model_;
  std::string endpoint_;
  std::size_t dimensions_;
  std::uint64_t timeout_ms_;
  std::shared_ptr<common::HttpClient> http_client_;
};

} // namespace recollect::memory
