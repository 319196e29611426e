#pragma once

#include "recollect/common/result.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace recollect::memory {

enum class LearningType {
  WorkingSolution,
  Gotcha,
  Pattern,
  Decision,
  Failure,
  Preference,
};

inline constexpr std::array<LearningType, 6> kAllLearningTypes = {
    LearningType::WorkingSolution, LearningType::Gotcha,  LearningType::Pattern,
    LearningType::Decision,        LearningType::Failure, LearningType::Preference,
};

/// Canonical upper-case name, e.g. "WORKING_SOLUTION".
[[nodiscard]] std::string type_to_string(LearningType type);

/// Case-insensitive; accepts "working_solution" as well as "WORKING_SOLUTION".
[[nodiscard]] std::optional<LearningType> type_from_string(std::string_view value);

struct LearningRecord {
  std::string id;
  LearningType type = LearningType::Pattern;
  std::string content;
  std::string context;
  double confidence = 0.0;
  std::vector<float> embedding;
  std::string session_source;
  std::string created_at;
  std::string updated_at;
  std::uint32_t merge_count = 1;
  bool archived = false;
};

/// A candidate learning as submitted by a caller, before id assignment.
struct LearningDraft {
  LearningType type = LearningType::Pattern;
  std::string content;
  std::string context;
  double confidence = 0.0;
  std::string session_source;
};

/// Fields the merge engine may change on an existing record.
struct RecordPatch {
  std::optional<std::string> content;
  std::optional<std::string> context;
  std::optional<double> confidence;
  std::optional<std::vector<float>> embedding;
  std::optional<std::uint32_t> merge_count;
  std::optional<std::string> session_source;
};

struct RecordFilter {
  std::optional<LearningType> type;
  std::optional<std::string> session_source;
  double min_confidence = 0.0;
  bool include_archived = false;
};

struct StoreStats {
  std::size_t total = 0;
  std::size_t archived = 0;
  std::array<std::size_t, kAllLearningTypes.size()> by_type{};
};

/// Reject empty content and out-of-range or below-admission confidence.
[[nodiscard]] common::Status validate_draft(const LearningDraft &draft,
                                            double admission_threshold);

/// Text that is embedded for a record.
[[nodiscard]] std::string embedding_text(const std::string &content, const std::string &context,
                                         bool include_context);

/// UTC timestamp with millisecond precision, e.g. 2026-10-18T09:14:03.271Z.
[[nodiscard]] std::string now_rfc3339();

/// `lrn_` followed by 32 hex characters of CSPRNG output.
[[nodiscard]] common::Result<std::string> generate_learning_id();

} // namespace recollect::memory
