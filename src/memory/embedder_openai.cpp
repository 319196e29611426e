#include "recollect/memory/embedder_openai.hpp"

#include "recollect/common/json_util.hpp"

#include <cstdlib>
#include <sstream>

namespace recollect::memory {

namespace {

constexpr const char *kDefaultBaseUrl = "https://api.openai.com";

std::string strip_trailing_slash(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

common::Status check_response(const common::HttpResponse &response) {
  if (response.timeout) {
    return common::Status::error(common::ErrorCode::EmbeddingTimeout,
                                 "embedding request timed out");
  }
  if (response.network_error) {
    return common::Status::error(common::ErrorCode::EmbeddingUnavailable,
                                 "embedding request failed: " + response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    std::string message = common::json_get_string(common::json_get_object(response.body, "error"),
                                                   "message");
    if (message.empty()) {
      message = "HTTP " + std::to_string(response.status);
    }
    return common::Status::error(common::ErrorCode::EmbeddingUnavailable,
                                 "embedding API error: " + message);
  }
  return common::Status::success();
}

common::Result<std::vector<std::vector<float>>>
parse_embeddings(const std::string &body, const std::size_t expected_count,
                 const std::size_t dimensions) {
  using R = common::Result<std::vector<std::vector<float>>>;
  const std::string data = common::json_get_array(body, "data");
  if (data.empty()) {
    return R::failure(common::ErrorCode::EmbeddingUnavailable,
                      "embedding response has no data array");
  }

  std::vector<std::vector<float>> out(expected_count);
  std::vector<bool> filled(expected_count, false);
  std::size_t position = 0;
  for (const auto &item : common::json_split_top_level_objects(data)) {
    std::size_t slot = position++;
    const std::string index = common::json_get_number(item, "index");
    if (!index.empty()) {
      slot = static_cast<std::size_t>(std::strtoull(index.c_str(), nullptr, 10));
    }
    if (slot >= expected_count) {
      return R::failure(common::ErrorCode::EmbeddingUnavailable,
                        "embedding response index out of range");
    }

    auto values = common::json_parse_float_array(common::json_get_array(item, "embedding"));
    if (!values.ok()) {
      return R::failure(common::ErrorCode::EmbeddingUnavailable,
                        "embedding response is malformed: " + values.error());
    }
    if (values.value().size() != dimensions) {
      return R::failure(common::ErrorCode::EmbeddingUnavailable,
                        "embedding provider returned " + std::to_string(values.value().size()) +
                            " dimensions, expected " + std::to_string(dimensions));
    }
    out[slot] = std::move(values.value());
    filled[slot] = true;
  }

  for (const bool ok : filled) {
    if (!ok) {
      return R::failure(common::ErrorCode::EmbeddingUnavailable,
                        "embedding response is missing entries");
    }
  }
  return R::success(std::move(out));
}

} // namespace

OpenAiEmbedder::OpenAiEmbedder(std::string api_key, std::string model, std::string base_url,
                               const std::size_t dimensions, const std::uint64_t timeout_ms,
                               std::shared_ptr<common::HttpClient> http_client)
    : api_key_(std::move(api_key)), model_(std::move(model)),
      endpoint_(strip_trailing_slash(base_url.empty() ? kDefaultBaseUrl : std::move(base_url)) +
                "/v1/embeddings"),
      dimensions_(dimensions), timeout_ms_(timeout_ms), http_client_(std::move(http_client)) {}

std::string_view OpenAiEmbedder::name() const { return "openai"; }

common::Result<std::vector<float>> OpenAiEmbedder::embed(const std::string_view text) {
  auto batch = embed_batch({std::string(text)});
  if (!batch.ok()) {
    return common::Result<std::vector<float>>::failure(batch.status());
  }
  return common::Result<std::vector<float>>::success(std::move(batch.value().front()));
}

common::Result<std::vector<std::vector<float>>>
OpenAiEmbedder::embed_batch(const std::vector<std::string> &texts) {
  using R = common::Result<std::vector<std::vector<float>>>;
  if (texts.empty()) {
    return R::success({});
  }
  if (api_key_.empty()) {
    return R::failure(common::ErrorCode::EmbeddingUnavailable, "missing API key");
  }

  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(model_) << "\",";
  // Only the text-embedding-3 family accepts a requested size.
  if (model_.rfind("text-embedding-3", 0) == 0) {
    body << "\"dimensions\":" << dimensions_ << ",";
  }
  body << "\"input\":[";
  for (std::size_t i = 0; i < texts.size(); ++i) {
    if (i > 0) {
      body << ",";
    }
    body << "\"" << common::json_escape(texts[i]) << "\"";
  }
  body << "]}";

  const common::HttpHeaders headers = {
      {"Content-Type", "application/json"},
      {"Authorization", "Bearer " + api_key_},
  };

  const auto response = http_client_->post_json(endpoint_, headers, body.str(), timeout_ms_);
  if (auto status = check_response(response); !status.ok()) {
    return R::failure(status);
  }
  return parse_embeddings(response.body, texts.size(), dimensions_);
}

std::size_t OpenAiEmbedder::dimensions() const { return dimensions_; }

} // namespace recollect::memory
