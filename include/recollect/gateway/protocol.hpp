#pragma once

#include "recollect/common/json_util.hpp"
#include "recollect/common/result.hpp"
#include "recollect/memory/learning.hpp"
#include "recollect/memory/merge_engine.hpp"
#include "recollect/memory/query_engine.hpp"
#include "recollect/memory/record_store.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace recollect::gateway {

inline constexpr std::size_t kDefaultListLimit = 50;
inline constexpr std::size_t kMaxListLimit = 500;

struct ListRequest {
  memory::RecordFilter filter;
  std::size_t limit = kDefaultListLimit;
  std::optional<std::string> cursor;
};

/// Shortest round-trippable text for a JSON number.
[[nodiscard]] std::string format_number(double value);

/// Record without its embedding.
[[nodiscard]] std::string record_to_json(const memory::LearningRecord &record);
[[nodiscard]] std::string ranked_to_json(const memory::RankedLearning &ranked);
[[nodiscard]] std::string outcome_to_json(const memory::StoreOutcome &outcome);
[[nodiscard]] std::string stats_to_json(const memory::StoreStats &stats, std::size_t indexed);
[[nodiscard]] std::string page_to_json(const memory::RecordPage &page);

[[nodiscard]] common::Result<memory::LearningDraft> parse_draft(const std::string &json);
/// `{"learnings":[...]}`. Fails only when the envelope is malformed; each
/// item carries its own parse result.
[[nodiscard]] common::Result<std::vector<common::Result<memory::LearningDraft>>>
parse_draft_batch(const std::string &json);
[[nodiscard]] common::Result<memory::QueryRequest> parse_query_request(const std::string &json);
[[nodiscard]] common::Result<ListRequest>
parse_list_request(const std::unordered_map<std::string, std::string> &query);

} // namespace recollect::gateway
