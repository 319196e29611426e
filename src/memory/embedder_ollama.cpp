#include "recollect/memory/embedder_ollama.hpp"

#include "recollect/common/json_util.hpp"

#include <sstream>

namespace recollect::memory {

namespace {

constexpr const char *kDefaultBaseUrl = "http://localhost:11434";

std::string strip_trailing_slash(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

} // namespace

OllamaEmbedder::OllamaEmbedder(std::string model, std::string base_url,
                               const std::size_t dimensions, const std::uint64_t timeout_ms,
                               std::shared_ptr<common::HttpClient> http_client)
    : model_(std::move(model)),
      endpoint_(strip_trailing_slash(base_url.empty() ? kDefaultBaseUrl : std::move(base_url)) +
                "/api/embeddings"),
      dimensions_(dimensions), timeout_ms_(timeout_ms), http_client_(std::move(http_client)) {}

std::string_view OllamaEmbedder::name() const { return "ollama"; }

common::Result<std::vector<float>> OllamaEmbedder::embed(const std::string_view text) {
  using R = common::Result<std::vector<float>>;

  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(model_) << "\",";
  body << "\"prompt\":\"" << common::json_escape(std::string(text)) << "\"";
  body << "}";

  const common::HttpHeaders headers = {{"Content-Type", "application/json"}};
  const auto response = http_client_->post_json(endpoint_, headers, body.str(), timeout_ms_);
  if (response.timeout) {
    return R::failure(common::ErrorCode::EmbeddingTimeout, "ollama request timed out");
  }
  if (response.network_error) {
    return R::failure(common::ErrorCode::EmbeddingUnavailable,
                      "ollama request failed: " + response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    std::string message = common::json_get_string(response.body, "error");
    if (message.empty()) {
      message = "HTTP " + std::to_string(response.status);
    }
    return R::failure(common::ErrorCode::EmbeddingUnavailable, "ollama error: " + message);
  }

  auto values = common::json_parse_float_array(common::json_get_array(response.body, "embedding"));
  if (!values.ok()) {
    return R::failure(common::ErrorCode::EmbeddingUnavailable,
                      "ollama response is malformed: " + values.error());
  }
  if (values.value().size() != dimensions_) {
    return R::failure(common::ErrorCode::EmbeddingUnavailable,
                      "ollama returned " + std::to_string(values.value().size()) +
                          " dimensions, expected " + std::to_string(dimensions_));
  }
  return values;
}

common::Result<std::vector<std::vector<float>>>
OllamaEmbedder::embed_batch(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    auto emb = embed(text);
    if (!emb.ok()) {
      return common::Result<std::vector<std::vector<float>>>::failure(emb.status());
    }
    out.push_back(std::move(emb.value()));
  }
  return common::Result<std::vector<std::vector<float>>>::success(std::move(out));
}

std::size_t OllamaEmbedder::dimensions() const { return dimensions_; }

} // namespace recollect::memory
