#pragma once

#include "recollect/memory/learning.hpp"

#include <vector>

namespace recollect::memory {

struct RankedLearning {
  LearningRecord record;
  double score = 0.0;
  double final_score = 0.0;
};

/// Blends similarity with the record's own confidence:
/// final = similarity_weight * score + confidence_weight * confidence.
class ConfidenceRanker {
public:
  ConfidenceRanker(double similarity_weight, double confidence_weight);

  /// Fill `final_score`, sort best first and keep at most `limit`.
  [[nodiscard]] std::vector<RankedLearning> rank(std::vector<RankedLearning> candidates,
                                                 std::size_t limit) const;

  [[nodiscard]] double similarity_weight() const { return similarity_weight_; }
  [[nodiscard]] double confidence_weight() const { return confidence_weight_; }

private:
  double similarity_weight_;
  double confidence_weight_;
};

} // namespace recollect::memory
