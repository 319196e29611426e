#include "recollect/memory/query_engine.hpp"

#include "recollect/common/fs.hpp"
#include "recollect/observability/global.hpp"

#include <chrono>
#include <cmath>

namespace recollect::memory {

QueryOptions QueryOptions::from_config(const config::Config &config) {
  return QueryOptions{
      .default_k = config.query.default_k,
      .max_k = config.query.max_k,
      .oversample = config.query.oversample,
      .similarity_weight = config.query.similarity_weight,
      .confidence_weight = config.query.confidence_weight,
  };
}

QueryEngine::QueryEngine(RecordStore &store, SimilarityIndex &index, IEmbedder &embedder,
                         QueryOptions options)
    : store_(store), index_(index), embedder_(embedder), options_(options),
      ranker_(options.similarity_weight, options.confidence_weight) {}

common::Result<QueryResponse> QueryEngine::query(const QueryRequest &request) {
  using R = common::Result<QueryResponse>;
  const auto started = std::chrono::steady_clock::now();

  if (common::trim(request.probe_text).empty()) {
    return R::failure(common::ErrorCode::Validation, "probe_text must not be empty");
  }
  const std::size_t k = request.k.value_or(options_.default_k);
  if (k < 1 || k > options_.max_k) {
    return R::failure(common::ErrorCode::Validation,
                      "k must be between 1 and " + std::to_string(options_.max_k));
  }
  if (!std::isfinite(request.min_confidence) || !std::isfinite(request.min_score)) {
    return R::failure(common::ErrorCode::Validation, "thresholds must be finite numbers");
  }

  auto probe = embedder_.embed(request.probe_text);
  if (!probe.ok()) {
    observability::record_embedding_failure(std::string(embedder_.name()), probe.error(),
                                            probe.code() == common::ErrorCode::EmbeddingTimeout);
    return R::failure(probe.status());
  }

  const std::size_t fetch = k * (options_.oversample == 0 ? 1 : options_.oversample);
  auto hits = index_.search(probe.value(), fetch, request.min_score, request.type_filter);
  if (!hits.ok()) {
    return R::failure(hits.status());
  }

  std::vector<RankedLearning> candidates;
  candidates.reserve(hits.value().size());
  for (const auto &hit : hits.value()) {
    auto record = store_.get(hit.id);
    if (!record.ok()) {
      // The index may briefly trail a forget; skip what the store no longer has.
      if (record.code() == common::ErrorCode::NotFound) {
        continue;
      }
      return R::failure(record.status());
    }
    const auto &value = record.value();
    if (value.archived) {
      continue;
    }
    if (request.type_filter.has_value() && value.type != *request.type_filter) {
      continue;
    }
    if (value.confidence < request.min_confidence) {
      continue;
    }
    candidates.push_back(RankedLearning{.record = value, .score = hit.score, .final_score = 0.0});
  }

  QueryResponse response{.results = ranker_.rank(std::move(candidates), k),
                         .candidates = hits.value().size()};
  observability::record_query(
      response.results.size(), response.candidates,
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                            started));
  return R::success(std::move(response));
}

} // namespace recollect::memory
