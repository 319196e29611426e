#pragma once

#include "recollect/common/result.hpp"
#include "recollect/memory/learning.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace recollect::memory {

class RecordStore;

struct IndexHit {
  std::string id;
  double score = 0.0;
};

/// Exhaustive cosine-similarity index over record embeddings, keyed by id.
/// A derived view of the record store: it can always be rebuilt from it.
class SimilarityIndex {
public:
  explicit SimilarityIndex(std::size_t dimensions);

  [[nodiscard]] common::Status upsert(const std::string &id, const std::vector<float> &embedding,
                                      LearningType type, const std::string &created_at,
                                      const std::string &updated_at);
  [[nodiscard]] common::Status upsert(const LearningRecord &record);
  bool remove(const std::string &id);

  /// At most `k` hits with score >= `min_score`, best first; equal scores
  /// put the more recently created record first.
  [[nodiscard]] common::Result<std::vector<IndexHit>>
  search(const std::vector<float> &query, std::size_t k, double min_score,
         std::optional<LearningType> type_filter = std::nullopt) const;

  /// Replace the contents with every non-archived record in `store`.
  /// Upserts and removes that land while the store is being scanned are
  /// replayed onto the rebuilt entries before they are published.
  [[nodiscard]] common::Result<std::size_t> rebuild(RecordStore &store);

  /// Write a binary snapshot via temp file and rename.
  [[nodiscard]] common::Status save(const std::filesystem::path &path) const;

  /// Load a snapshot. Fails, leaving the index untouched, when the file is
  /// unreadable, its dimensionality differs, or its (id, updated_at) set
  /// disagrees with `active_versions` from the store.
  [[nodiscard]] common::Status
  load(const std::filesystem::path &path,
       const std::unordered_map<std::string, std::string> &active_versions);

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] bool contains(const std::string &id) const;
  [[nodiscard]] std::size_t dimensions() const { return dimensions_; }

private:
  struct Entry {
    std::vector<float> values;
    double norm = 0.0;
    LearningType type = LearningType::Pattern;
    std::string created_at;
    std::string updated_at;
  };

  [[nodiscard]] static Entry make_entry(const std::vector<float> &embedding, LearningType type,
                                        const std::string &created_at,
                                        const std::string &updated_at);

  struct JournalOp {
    std::string id;
    std::optional<Entry> entry; // nullopt marks a removal
  };

  std::size_t dimensions_;
  std::mutex rebuild_mutex_;
  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, Entry> entries_;
  bool rebuilding_ = false;
  std::vector<JournalOp> journal_;
};

/// Cosine similarity in [-1, 1]; 0 for mismatched or zero-length vectors.
[[nodiscard]] double cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

} // namespace recollect::memory
