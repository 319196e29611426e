#pragma once

#include "recollect/common/result.hpp"
#include "recollect/config/schema.hpp"
#include "recollect/memory/embedder.hpp"
#include "recollect/memory/ranker.hpp"
#include "recollect/memory/record_store.hpp"
#include "recollect/memory/similarity_index.hpp"

#include <optional>
#include <string>
#include <vector>

namespace recollect::memory {

struct QueryRequest {
  std::string probe_text;
  std::optional<std::size_t> k;
  std::optional<LearningType> type_filter;
  double min_confidence = 0.0;
  double min_score = -1.0;
};

struct QueryOptions {
  std::size_t default_k = 5;
  std::size_t max_k = 100;
  std::size_t oversample = 3;
  double similarity_weight = 0.7;
  double confidence_weight = 0.3;

  [[nodiscard]] static QueryOptions from_config(const config::Config &config);
};

struct QueryResponse {
  std::vector<RankedLearning> results;
  /// Index hits considered before filtering.
  std::size_t candidates = 0;
};

/// Read path: embed the probe, pull `oversample * k` hits from the index,
/// hydrate them from the store, drop archived, mistyped and low-confidence
/// records, then rank by blended score.
class QueryEngine {
public:
  QueryEngine(RecordStore &store, SimilarityIndex &index, IEmbedder &embedder,
              QueryOptions options);

  [[nodiscard]] common::Result<QueryResponse> query(const QueryRequest &request);

  [[nodiscard]] const QueryOptions &options() const { return options_; }

private:
  RecordStore &store_;
  SimilarityIndex &index_;
  IEmbedder &embedder_;
  QueryOptions options_;
  ConfidenceRanker ranker_;
};

} // namespace recollect::memory
