#include "test_framework.hpp"

#include "recollect/memory/embedder.hpp"
#include "recollect/memory/embedder_local.hpp"
#include "recollect/memory/embedder_ollama.hpp"
#include "recollect/memory/embedder_openai.hpp"
#include "recollect/memory/embedding_cache.hpp"
#include "recollect/memory/similarity_index.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cmath>

namespace {

namespace mem = recollect::memory;
using recollect::testing::MockHttpClient;

double l2_norm(const std::vector<float> &values) {
  double sum = 0.0;
  for (const float v : values) {
    sum += static_cast<double>(v) * static_cast<double>(v);
  }
  return std::sqrt(sum);
}

/// Counts calls through to a LocalEmbedder.
class CountingEmbedder final : public mem::IEmbedder {
public:
  [[nodiscard]] std::string_view name() const override { return "counting"; }
  [[nodiscard]] recollect::common::Result<std::vector<float>>
  embed(std::string_view text) override {
    ++embed_calls;
    return inner_.embed(text);
  }
  [[nodiscard]] recollect::common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) override {
    ++batch_calls;
    batch_sizes.push_back(texts.size());
    return inner_.embed_batch(texts);
  }
  [[nodiscard]] std::size_t dimensions() const override { return inner_.dimensions(); }

  int embed_calls = 0;
  int batch_calls = 0;
  std::vector<std::size_t> batch_sizes;

private:
  mem::LocalEmbedder inner_{16};
};

} // namespace

void register_embedder_tests(std::vector<recollect::tests::TestCase> &tests) {
  using recollect::tests::require;
  using recollect::testing::TempWorkspace;
  namespace common = recollect::common;

  tests.push_back({"embedder_local_is_deterministic_and_normalized", [] {
                     mem::LocalEmbedder embedder;
                     require(embedder.dimensions() == 384, "default dimensions");
                     require(embedder.name() == "local", "name");
                     auto a = embedder.embed("SQLite busy timeout under load");
                     auto b = embedder.embed("SQLite busy timeout under load");
                     require(a.ok() && b.ok(), "embed should succeed");
                     require(a.value() == b.value(), "same text, same vector");
                     require(std::abs(l2_norm(a.value()) - 1.0) < 1e-5, "unit length");

                     mem::LocalEmbedder other_instance;
                     require(other_instance.embed("SQLite busy timeout under load").value() ==
                                 a.value(),
                             "stable across instances");
                   }});

  tests.push_back({"embedder_local_similarity_tracks_overlap", [] {
                     mem::LocalEmbedder embedder;
                     const auto base = embedder.embed("use a connection pool for postgres").value();
                     const auto close =
                         embedder.embed("Use a connection pool for Postgres!").value();
                     const auto far = embedder.embed("bananas ripen faster in paper bags").value();
                     const double close_score = mem::cosine_similarity(base, close);
                     const double far_score = mem::cosine_similarity(base, far);
                     require(close_score > 0.95, "case and punctuation should not matter");
                     require(far_score < 0.5, "unrelated text should be dissimilar");
                   }});

  tests.push_back({"embedder_local_batch_matches_single", [] {
                     mem::LocalEmbedder embedder(32);
                     auto batch = embedder.embed_batch({"alpha", "beta"});
                     require(batch.ok() && batch.value().size() == 2, "two embeddings");
                     require(batch.value()[1] == embedder.embed("beta").value(),
                             "batch equals single");
                     auto empty = embedder.embed("");
                     require(empty.ok() && empty.value().size() == 32,
                             "empty text still has the right shape");
                   }});

  tests.push_back({"embedder_openai_request_and_response", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->push_json(200, R"({"data":[{"index":1,"embedding":[0,1,0]},)"
                                          R"({"index":0,"embedding":[1,0,0]}]})");
                     mem::OpenAiEmbedder embedder("sk-test", "text-embedding-3-small",
                                                  "http://localhost:9999/", 3, 1500, http);
                     auto batch = embedder.embed_batch({"first", "second"});
                     require(batch.ok(), batch.error());
                     require(batch.value()[0] == std::vector<float>({1, 0, 0}),
                             "index 0 placed first");
                     require(batch.value()[1] == std::vector<float>({0, 1, 0}),
                             "index 1 placed second");

                     const auto requests = http->requests();
                     require(requests.size() == 1, "one request for the batch");
                     require(requests[0].url == "http://localhost:9999/v1/embeddings", "endpoint");
                     require(requests[0].headers.at("Authorization") == "Bearer sk-test",
                             "bearer auth");
                     require(requests[0].timeout_ms == 1500, "timeout forwarded");
                     require(requests[0].body.find("\"dimensions\":3") != std::string::npos,
                             "text-embedding-3 gets a dimensions field");
                     require(requests[0].body.find("\"input\":[\"first\",\"second\"]") !=
                                 std::string::npos,
                             "input array");
                   }});

  tests.push_back({"embedder_openai_omits_dimensions_for_legacy_models", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->push_json(200, R"({"data":[{"embedding":[0.6,0.8]}]})");
                     mem::OpenAiEmbedder embedder("sk", "text-embedding-ada-002", "", 2, 1000,
                                                  http);
                     auto single = embedder.embed("hello");
                     require(single.ok(), single.error());
                     require(http->requests()[0].url == "https://api.openai.com/v1/embeddings",
                             "default base url");
                     require(http->requests()[0].body.find("dimensions") == std::string::npos,
                             "legacy models do not get dimensions");
                   }});

  tests.push_back({"embedder_openai_error_mapping", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->push_response(common::HttpResponse{.timeout = true,
                                                              .network_error = true,
                                                              .network_error_message = "timeout"});
                     http->push_json(500, R"({"error":{"message":"overloaded"}})");
                     http->push_json(200, R"({"data":[{"embedding":[1,2,3,4]}]})");
                     http->push_json(200, R"({"nothing":true})");
                     mem::OpenAiEmbedder embedder("sk", "m", "", 3, 100, http);

                     auto timeout = embedder.embed("a");
                     require(timeout.code() == common::ErrorCode::EmbeddingTimeout, "timeout");
                     auto server_error = embedder.embed("a");
                     require(server_error.code() == common::ErrorCode::EmbeddingUnavailable,
                             "5xx is unavailable");
                     require(server_error.error().find("overloaded") != std::string::npos,
                             "provider message surfaced");
                     auto wrong_dims = embedder.embed("a");
                     require(wrong_dims.code() == common::ErrorCode::EmbeddingUnavailable,
                             "dimension mismatch is unavailable");
                     auto malformed = embedder.embed("a");
                     require(malformed.code() == common::ErrorCode::EmbeddingUnavailable,
                             "missing data is unavailable");

                     mem::OpenAiEmbedder keyless("", "m", "", 3, 100, http);
                     require(keyless.embed("a").code() == common::ErrorCode::EmbeddingUnavailable,
                             "missing key is unavailable");
                     require(http->requests().size() == 4, "keyless call never hits the network");
                   }});

  tests.push_back({"embedder_ollama_request_and_errors", [] {
                     auto http = std::make_shared<MockHttpClient>();
                     http->push_json(200, R"({"embedding":[0.1,0.2]})");
                     http->push_response(common::HttpResponse{
                         .network_error = true, .network_error_message = "connection refused"});
                     mem::OllamaEmbedder embedder("nomic-embed-text", "", 2, 500, http);
                     auto ok = embedder.embed("text");
                     require(ok.ok(), ok.error());
                     require(ok.value().size() == 2, "two dims");
                     const auto request = http->requests()[0];
                     require(request.url == "http://localhost:11434/api/embeddings",
                             "default ollama endpoint");
                     require(request.body.find("\"prompt\":\"text\"") != std::string::npos,
                             "prompt field");
                     require(request.body.find("\"model\":\"nomic-embed-text\"") !=
                                 std::string::npos,
                             "model field");
                     auto down = embedder.embed("text");
                     require(down.code() == common::ErrorCode::EmbeddingUnavailable,
                             "network error is unavailable");
                   }});

  tests.push_back({"embedding_cache_persists_and_trims", [] {
                     TempWorkspace workspace;
                     const auto db = workspace.path() / "cache.db";
                     {
                       mem::EmbeddingCache cache(db, 2);
                       require(cache.open().ok(), "open cache");
                       require(cache.put("a", {1, 0}).ok(), "put a");
                       auto hit = cache.get("a");
                       require(hit.ok() && hit.value().has_value(), "hit a");
                       require(*hit.value() == std::vector<float>({1, 0}), "stored vector");
                       auto miss = cache.get("zzz");
                       require(miss.ok() && !miss.value().has_value(), "miss");
                       const auto stats = cache.stats();
                       require(stats.hits == 1 && stats.misses == 1, "hit/miss counters");
                     }
                     mem::EmbeddingCache reopened(db, 2);
                     require(reopened.open().ok(), "reopen cache");
                     auto persisted = reopened.get("a");
                     require(persisted.ok() && persisted.value().has_value(),
                             "entry survives reopen");
                     require(reopened.put("b", {0, 1}).ok(), "put b");
                     require(reopened.put("c", {1, 1}).ok(), "put c");
                     require(reopened.stats().entries <= 2, "capacity enforced");
                   }});

  tests.push_back({"cached_embedder_only_embeds_misses", [] {
                     TempWorkspace workspace;
                     auto inner = std::make_unique<CountingEmbedder>();
                     auto *counter = inner.get();
                     auto cache =
                         std::make_unique<mem::EmbeddingCache>(workspace.path() / "c.db", 100);
                     require(cache->open().ok(), "open cache");
                     mem::CachedEmbedder embedder(std::move(inner), std::move(cache));
                     require(embedder.name() == "counting", "name passes through");
                     require(embedder.dimensions() == 16, "dimensions pass through");

                     auto first = embedder.embed("hello");
                     auto second = embedder.embed("hello");
                     require(first.ok() && second.ok(), "embeds");
                     require(first.value() == second.value(), "cached value identical");
                     require(counter->embed_calls == 1, "second call served from cache");

                     auto batch = embedder.embed_batch({"hello", "world", "again"});
                     require(batch.ok() && batch.value().size() == 3, "batch");
                     require(counter->batch_calls == 1, "one provider batch");
                     require(counter->batch_sizes.back() == 2, "only misses sent");
                     require(batch.value()[0] == first.value(), "cached item in place");
                     require(embedder.cache().stats().hits >= 2, "hits recorded");
                   }});

  tests.push_back({"create_embedder_selects_provider", [] {
                     TempWorkspace workspace;
                     auto config = recollect::testing::mock_config();
                     config.embedding.dimensions = 64;
                     auto local = mem::create_embedder(config, workspace.path() / "x.db");
                     require(local.ok(), local.error());
                     require(local.value()->name() == "local" &&
                                 local.value()->dimensions() == 64,
                             "local provider");

                     config.embedding.provider = "openai";
                     config.embedding.cache_enabled = true;
                     config.embedding.api_key = "sk";
                     auto openai = mem::create_embedder(config, workspace.path() / "x.db");
                     require(openai.ok(), openai.error());
                     require(openai.value()->name() == "openai", "openai provider");
                     require(dynamic_cast<mem::CachedEmbedder *>(openai.value().get()) != nullptr,
                             "remote providers are cached");

                     config.embedding.provider = "fasttext";
                     auto unknown = mem::create_embedder(config, workspace.path() / "x.db");
                     require(unknown.code() == common::ErrorCode::Validation, "unknown provider");
                   }});
}
