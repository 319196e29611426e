#include "recollect/memory/ranker.hpp"

#include <algorithm>

namespace recollect::memory {

ConfidenceRanker::ConfidenceRanker(const double similarity_weight, const double confidence_weight)
    : similarity_weight_(similarity_weight), confidence_weight_(confidence_weight) {}

std::vector<RankedLearning> ConfidenceRanker::rank(std::vector<RankedLearning> candidates,
                                                   const std::size_t limit) const {
  for (auto &candidate : candidates) {
    candidate.final_score = similarity_weight_ * candidate.score +
                            confidence_weight_ * candidate.record.confidence;
  }

  std::sort(candidates.begin(), candidates.end(), [](const auto &lhs, const auto &rhs) {
    if (lhs.final_score != rhs.final_score) {
      return lhs.final_score > rhs.final_score;
    }
    if (lhs.score != rhs.score) {
      return lhs.score > rhs.score;
    }
    if (lhs.record.created_at != rhs.record.created_at) {
      return lhs.record.created_at > rhs.record.created_at;
    }
    return lhs.record.id < rhs.record.id;
  });

  if (candidates.size() > limit) {
    candidates.resize(limit);
  }
  return candidates;
}

} // namespace recollect::memory
