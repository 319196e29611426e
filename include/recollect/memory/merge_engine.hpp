#pragma once

#include "recollect/common/result.hpp"
#include "recollect/config/schema.hpp"
#include "recollect/memory/embedder.hpp"
#include "recollect/memory/learning.hpp"
#include "recollect/memory/record_store.hpp"
#include "recollect/memory/similarity_index.hpp"

#include <array>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace recollect::memory {

struct MergeOptions {
  double similarity_threshold = 0.92;
  bool merge_context = true;
  bool refresh_session_source = false;
  bool include_context = false;
  std::chrono::milliseconds lock_timeout{2000};

  [[nodiscard]] static MergeOptions from_config(const config::Config &config);
};

struct StoreOutcome {
  std::string id;
  bool created = false;
  /// Similarity of the record the candidate was merged into.
  std::optional<double> similarity;
  std::uint32_t merge_count = 1;
};

/// Merge a candidate into an existing record. Content: the longer text wins,
/// ties keep the existing one. Context: appended with " | " when enabled and
/// not already present. Confidence: the maximum.
[[nodiscard]] RecordPatch merge_patch(const LearningRecord &existing, const LearningDraft &candidate,
                                      const std::vector<float> &candidate_embedding,
                                      const MergeOptions &options);

/// Write path. Each store request is validated, embedded outside any lock,
/// then either merged into the best same-type match at or above the dedup
/// threshold or created fresh.
///
/// Per-type lanes serialize the search-then-write window so concurrent
/// duplicates converge on one record; per-record lanes serialize writers of
/// one record (merges, forget). Both are timed and fail with
/// ErrorCode::ConcurrencyConflict when not acquired within `lock_timeout`.
class MergeEngine {
public:
  MergeEngine(RecordStore &store, SimilarityIndex &index, IEmbedder &embedder,
              MergeOptions options);

  [[nodiscard]] common::Result<StoreOutcome> store(const LearningDraft &draft);

  /// Items are embedded in one batch call; every item gets its own result.
  [[nodiscard]] std::vector<common::Result<StoreOutcome>>
  store_batch(const std::vector<LearningDraft> &drafts);

  /// Archive a record and drop it from the index. False when unknown or
  /// already archived.
  [[nodiscard]] common::Result<bool> forget(const std::string &id);

  [[nodiscard]] const MergeOptions &options() const { return options_; }

private:
  [[nodiscard]] common::Result<std::vector<float>> embed_draft(const LearningDraft &draft);
  [[nodiscard]] common::Result<StoreOutcome> store_embedded(const LearningDraft &draft,
                                                            const std::vector<float> &embedding);
  [[nodiscard]] common::Result<StoreOutcome> create_fresh(const LearningDraft &draft,
                                                          const std::vector<float> &embedding);
  [[nodiscard]] std::shared_ptr<std::timed_mutex> record_lane(const std::string &id);
  [[nodiscard]] std::timed_mutex &type_lane(LearningType type);

  RecordStore &store_;
  SimilarityIndex &index_;
  IEmbedder &embedder_;
  MergeOptions options_;

  std::array<std::timed_mutex, kAllLearningTypes.size()> type_lanes_;
  std::mutex record_lanes_mutex_;
  std::unordered_map<std::string, std::weak_ptr<std::timed_mutex>> record_lanes_;
};

} // namespace recollect::memory
