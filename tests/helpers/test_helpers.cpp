#include "tests/helpers/test_helpers.hpp"

#include "recollect/memory/embedder_local.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <random>

namespace recollect::testing {

config::Config mock_config() {
  config::Config config;
  config.embedding.provider = "local";
  config.embedding.cache_enabled = false;
  config.index.snapshot_interval_secs = 0;
  config.observability.backend = "none";
  config.server.worker_threads = 4;
  return config;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() /
          ("recollect-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

config::Config temp_config(const TempWorkspace &workspace) {
  auto config = mock_config();
  config.store.data_dir = (workspace.path() / "data").string();
  return config;
}

ScriptedEmbedder::ScriptedEmbedder(const std::size_t dimensions) : dimensions_(dimensions) {}

void ScriptedEmbedder::set(const std::string &text, std::vector<float> embedding) {
  std::lock_guard<std::mutex> lock(mutex_);
  scripted_[text] = std::move(embedding);
}

common::Result<std::vector<float>> ScriptedEmbedder::embed(std::string_view text) {
  ++calls_;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = scripted_.find(std::string(text));
    if (it != scripted_.end()) {
      return common::Result<std::vector<float>>::success(it->second);
    }
  }
  memory::LocalEmbedder fallback(dimensions_);
  return fallback.embed(text);
}

common::Result<std::vector<std::vector<float>>>
ScriptedEmbedder::embed_batch(const std::vector<std::string> &texts) {
  using R = common::Result<std::vector<std::vector<float>>>;
  ++batch_calls_;
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    auto embedding = embed(text);
    if (!embedding.ok()) {
      return R::failure(embedding.status());
    }
    out.push_back(std::move(embedding.value()));
  }
  return R::success(std::move(out));
}

FailingEmbedder::FailingEmbedder(const common::ErrorCode code, const std::size_t dimensions)
    : code_(code), dimensions_(dimensions) {}

common::Result<std::vector<float>> FailingEmbedder::embed(std::string_view) {
  return common::Result<std::vector<float>>::failure(code_, "embedding provider is down");
}

common::Result<std::vector<std::vector<float>>>
FailingEmbedder::embed_batch(const std::vector<std::string> &) {
  return common::Result<std::vector<std::vector<float>>>::failure(code_,
                                                                  "embedding provider is down");
}

void MockHttpClient::push_response(common::HttpResponse response) {
  std::lock_guard<std::mutex> lock(mutex_);
  responses_.push_back(std::move(response));
}

void MockHttpClient::push_json(const std::uint16_t status, std::string body) {
  push_response(common::HttpResponse{.status = status, .body = std::move(body)});
}

common::HttpResponse MockHttpClient::next(Request request) {
  std::lock_guard<std::mutex> lock(mutex_);
  requests_.push_back(std::move(request));
  if (next_response_ >= responses_.size()) {
    return common::HttpResponse{.network_error = true,
                                .network_error_message = "no scripted response"};
  }
  return responses_[next_response_++];
}

common::HttpResponse MockHttpClient::post_json(const std::string &url,
                                               const common::HttpHeaders &headers,
                                               const std::string &body,
                                               const std::uint64_t timeout_ms) {
  return next(Request{.method = "POST",
                      .url = url,
                      .headers = headers,
                      .body = body,
                      .timeout_ms = timeout_ms});
}

common::HttpResponse MockHttpClient::get(const std::string &url,
                                         const common::HttpHeaders &headers,
                                         const std::uint64_t timeout_ms) {
  return next(Request{.method = "GET", .url = url, .headers = headers, .timeout_ms = timeout_ms});
}

common::HttpResponse MockHttpClient::del(const std::string &url,
                                         const common::HttpHeaders &headers,
                                         const std::uint64_t timeout_ms) {
  return next(
      Request{.method = "DELETE", .url = url, .headers = headers, .timeout_ms = timeout_ms});
}

std::vector<MockHttpClient::Request> MockHttpClient::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

EnvGuard::EnvGuard(std::string name, const std::optional<std::string> &value)
    : name_(std::move(name)) {
  if (const char *existing = std::getenv(name_.c_str()); existing != nullptr) {
    previous_ = std::string(existing);
  }
  if (value.has_value()) {
    setenv(name_.c_str(), value->c_str(), 1);
  } else {
    unsetenv(name_.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (previous_.has_value()) {
    setenv(name_.c_str(), previous_->c_str(), 1);
  } else {
    unsetenv(name_.c_str());
  }
}

std::vector<float> axis_vector(const std::size_t dimensions, const std::size_t axis,
                               const std::optional<std::size_t> tilt_axis, const float tilt) {
  std::vector<float> values(dimensions, 0.0F);
  values[axis % dimensions] = 1.0F;
  if (tilt_axis.has_value()) {
    values[*tilt_axis % dimensions] += tilt;
  }
  double norm = 0.0;
  for (const float v : values) {
    norm += static_cast<double>(v) * static_cast<double>(v);
  }
  norm = std::sqrt(norm);
  for (auto &v : values) {
    v = static_cast<float>(v / norm);
  }
  return values;
}

memory::LearningDraft make_draft(const memory::LearningType type, std::string content,
                                 const double confidence, std::string context,
                                 std::string session_source) {
  return memory::LearningDraft{.type = type,
                               .content = std::move(content),
                               .context = std::move(context),
                               .confidence = confidence,
                               .session_source = std::move(session_source)};
}

} // namespace recollect::testing
