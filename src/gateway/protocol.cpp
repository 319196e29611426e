#include "recollect/gateway/protocol.hpp"

#include "recollect/common/fs.hpp"

#include <charconv>
#include <cmath>
#include <cstdlib>
#include <sstream>

namespace recollect::gateway {

namespace {

common::Status invalid(const std::string &message) {
  return common::Status::error(common::ErrorCode::Validation, message);
}

bool is_null(const common::JsonField &field) { return !field.is_string && field.value == "null"; }

common::Result<std::optional<double>> parse_number_text(const std::string &text,
                                                        const std::string &name) {
  using R = common::Result<std::optional<double>>;
  const std::string trimmed = common::trim(text);
  if (trimmed.empty()) {
    return R::failure(invalid(name + " must be a number"));
  }
  char *end = nullptr;
  const double value = std::strtod(trimmed.c_str(), &end);
  if (end != trimmed.c_str() + trimmed.size() || !std::isfinite(value)) {
    return R::failure(invalid(name + " must be a number"));
  }
  return R::success(value);
}

common::Result<std::optional<std::string>> optional_string(const common::JsonFlatMap &fields,
                                                           const std::string &name) {
  using R = common::Result<std::optional<std::string>>;
  const auto it = fields.find(name);
  if (it == fields.end() || is_null(it->second)) {
    return R::success(std::nullopt);
  }
  if (!it->second.is_string) {
    return R::failure(invalid(name + " must be a string"));
  }
  return R::success(it->second.value);
}

common::Result<std::optional<double>> optional_number(const common::JsonFlatMap &fields,
                                                      const std::string &name) {
  using R = common::Result<std::optional<double>>;
  const auto it = fields.find(name);
  if (it == fields.end() || is_null(it->second)) {
    return R::success(std::nullopt);
  }
  if (it->second.is_string) {
    return R::failure(invalid(name + " must be a number"));
  }
  return parse_number_text(it->second.value, name);
}

common::Result<std::optional<std::size_t>> to_count(const std::optional<double> &value,
                                                    const std::string &name) {
  using R = common::Result<std::optional<std::size_t>>;
  if (!value.has_value()) {
    return R::success(std::nullopt);
  }
  if (*value < 0 || std::floor(*value) != *value || *value > 1e9) {
    return R::failure(invalid(name + " must be a non-negative integer"));
  }
  return R::success(static_cast<std::size_t>(*value));
}

common::Result<memory::LearningType> parse_type(const std::string &value) {
  const auto type = memory::type_from_string(common::trim(value));
  if (!type.has_value()) {
    return common::Result<memory::LearningType>::failure(
        invalid("unknown learning type: " + value));
  }
  return common::Result<memory::LearningType>::success(*type);
}

} // namespace

std::string format_number(const double value) {
  char buffer[64];
  const auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
  if (ec != std::errc()) {
    return "0";
  }
  return std::string(buffer, ptr);
}

std::string record_to_json(const memory::LearningRecord &record) {
  std::ostringstream out;
  out << "{";
  out << "\"id\":\"" << common::json_escape(record.id) << "\",";
  out << "\"type\":\"" << memory::type_to_string(record.type) << "\",";
  out << "\"content\":\"" << common::json_escape(record.content) << "\",";
  out << "\"context\":\"" << common::json_escape(record.context) << "\",";
  out << "\"confidence\":" << format_number(record.confidence) << ",";
  out << "\"session_source\":\"" << common::json_escape(record.session_source) << "\",";
  out << "\"created_at\":\"" << record.created_at << "\",";
  out << "\"updated_at\":\"" << record.updated_at << "\",";
  out << "\"merge_count\":" << record.merge_count << ",";
  out << "\"archived\":" << (record.archived ? "true" : "false");
  out << "}";
  return out.str();
}

std::string ranked_to_json(const memory::RankedLearning &ranked) {
  const auto &record = ranked.record;
  std::ostringstream out;
  out << "{";
  out << "\"id\":\"" << common::json_escape(record.id) << "\",";
  out << "\"type\":\"" << memory::type_to_string(record.type) << "\",";
  out << "\"content\":\"" << common::json_escape(record.content) << "\",";
  out << "\"context\":\"" << common::json_escape(record.context) << "\",";
  out << "\"confidence\":" << format_number(record.confidence) << ",";
  out << "\"score\":" << format_number(ranked.score) << ",";
  out << "\"final_score\":" << format_number(ranked.final_score) << ",";
  out << "\"merge_count\":" << record.merge_count << ",";
  out << "\"session_source\":\"" << common::json_escape(record.session_source) << "\",";
  out << "\"created_at\":\"" << record.created_at << "\"";
  out << "}";
  return out.str();
}

std::string outcome_to_json(const memory::StoreOutcome &outcome) {
  std::ostringstream out;
  out << "{";
  out << "\"id\":\"" << common::json_escape(outcome.id) << "\",";
  out << "\"created\":" << (outcome.created ? "true" : "false") << ",";
  out << "\"status\":\"" << (outcome.created ? "stored" : "duplicate") << "\",";
  if (outcome.similarity.has_value()) {
    out << "\"similarity\":" << format_number(*outcome.similarity) << ",";
  }
  out << "\"merge_count\":" << outcome.merge_count;
  out << "}";
  return out.str();
}

std::string stats_to_json(const memory::StoreStats &stats, const std::size_t indexed) {
  std::ostringstream out;
  out << "{";
  out << "\"total_learnings\":" << stats.total << ",";
  out << "\"archived\":" << stats.archived << ",";
  out << "\"indexed\":" << indexed << ",";
  out << "\"by_type\":{";
  for (std::size_t i = 0; i < memory::kAllLearningTypes.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << "\"" << memory::type_to_string(memory::kAllLearningTypes[i]) << "\":"
        << stats.by_type[i];
  }
  out << "}}";
  return out.str();
}

std::string page_to_json(const memory::RecordPage &page) {
  std::ostringstream out;
  out << "{\"records\":[";
  for (std::size_t i = 0; i < page.records.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << record_to_json(page.records[i]);
  }
  out << "]";
  if (page.next_cursor.has_value()) {
    out << ",\"next_cursor\":\"" << common::json_escape(*page.next_cursor) << "\"";
  }
  out << "}";
  return out.str();
}

common::Result<memory::LearningDraft> parse_draft(const std::string &json) {
  using R = common::Result<memory::LearningDraft>;
  if (!common::json_is_object(json)) {
    return R::failure(invalid("request body must be a JSON object"));
  }
  const auto fields = common::json_parse_flat(json);
  memory::LearningDraft draft;

  auto type = optional_string(fields, "type");
  if (!type.ok()) {
    return R::failure(type.status());
  }
  if (!type.value().has_value()) {
    return R::failure(invalid("type is required"));
  }
  auto parsed_type = parse_type(*type.value());
  if (!parsed_type.ok()) {
    return R::failure(parsed_type.status());
  }
  draft.type = parsed_type.value();

  auto content = optional_string(fields, "content");
  if (!content.ok()) {
    return R::failure(content.status());
  }
  if (!content.value().has_value()) {
    return R::failure(invalid("content is required"));
  }
  draft.content = *content.value();

  auto context = optional_string(fields, "context");
  if (!context.ok()) {
    return R::failure(context.status());
  }
  draft.context = context.value().value_or("");

  auto confidence = optional_number(fields, "confidence");
  if (!confidence.ok()) {
    return R::failure(confidence.status());
  }
  if (!confidence.value().has_value()) {
    return R::failure(invalid("confidence is required"));
  }
  draft.confidence = *confidence.value();

  auto session = optional_string(fields, "session_source");
  if (!session.ok()) {
    return R::failure(session.status());
  }
  draft.session_source = session.value().value_or("");
  return R::success(std::move(draft));
}

common::Result<std::vector<common::Result<memory::LearningDraft>>>
parse_draft_batch(const std::string &json) {
  using R = common::Result<std::vector<common::Result<memory::LearningDraft>>>;
  if (!common::json_is_object(json)) {
    return R::failure(invalid("request body must be a JSON object"));
  }
  const std::string array = common::json_get_array(json, "learnings");
  if (array.empty()) {
    return R::failure(invalid("learnings must be an array"));
  }

  std::vector<common::Result<memory::LearningDraft>> drafts;
  const auto items = common::json_split_top_level_values(array);
  drafts.reserve(items.size());
  for (std::size_t i = 0; i < items.size(); ++i) {
    if (!common::json_is_object(items[i])) {
      drafts.push_back(common::Result<memory::LearningDraft>::failure(
          invalid("learnings[" + std::to_string(i) + "] must be an object")));
      continue;
    }
    drafts.push_back(parse_draft(items[i]));
  }
  return R::success(std::move(drafts));
}

common::Result<memory::QueryRequest> parse_query_request(const std::string &json) {
  using R = common::Result<memory::QueryRequest>;
  if (!common::json_is_object(json)) {
    return R::failure(invalid("request body must be a JSON object"));
  }
  const auto fields = common::json_parse_flat(json);
  memory::QueryRequest request;

  auto probe = optional_string(fields, "probe_text");
  if (!probe.ok()) {
    return R::failure(probe.status());
  }
  if (!probe.value().has_value()) {
    return R::failure(invalid("probe_text is required"));
  }
  request.probe_text = *probe.value();

  auto k = optional_number(fields, "k");
  if (!k.ok()) {
    return R::failure(k.status());
  }
  auto count = to_count(k.value(), "k");
  if (!count.ok()) {
    return R::failure(count.status());
  }
  request.k = count.value();

  auto type = optional_string(fields, "type_filter");
  if (!type.ok()) {
    return R::failure(type.status());
  }
  if (type.value().has_value()) {
    auto parsed = parse_type(*type.value());
    if (!parsed.ok()) {
      return R::failure(parsed.status());
    }
    request.type_filter = parsed.value();
  }

  auto min_confidence = optional_number(fields, "min_confidence");
  if (!min_confidence.ok()) {
    return R::failure(min_confidence.status());
  }
  request.min_confidence = min_confidence.value().value_or(0.0);

  auto min_score = optional_number(fields, "min_score");
  if (!min_score.ok()) {
    return R::failure(min_score.status());
  }
  request.min_score = min_score.value().value_or(-1.0);
  return R::success(std::move(request));
}

common::Result<ListRequest>
parse_list_request(const std::unordered_map<std::string, std::string> &query) {
  using R = common::Result<ListRequest>;
  ListRequest request;

  if (const auto it = query.find("type"); it != query.end() && !it->second.empty()) {
    auto type = parse_type(it->second);
    if (!type.ok()) {
      return R::failure(type.status());
    }
    request.filter.type = type.value();
  }
  if (const auto it = query.find("session_source"); it != query.end() && !it->second.empty()) {
    request.filter.session_source = it->second;
  }
  if (const auto it = query.find("min_confidence"); it != query.end() && !it->second.empty()) {
    auto value = parse_number_text(it->second, "min_confidence");
    if (!value.ok()) {
      return R::failure(value.status());
    }
    request.filter.min_confidence = value.value().value_or(0.0);
  }
  if (const auto it = query.find("include_archived"); it != query.end()) {
    const std::string flag = common::to_lower(common::trim(it->second));
    if (flag == "true" || flag == "1" || flag.empty()) {
      request.filter.include_archived = true;
    } else if (flag != "false" && flag != "0") {
      return R::failure(invalid("include_archived must be true or false"));
    }
  }
  if (const auto it = query.find("limit"); it != query.end() && !it->second.empty()) {
    auto value = parse_number_text(it->second, "limit");
    if (!value.ok()) {
      return R::failure(value.status());
    }
    auto limit = to_count(value.value(), "limit");
    if (!limit.ok()) {
      return R::failure(limit.status());
    }
    if (*limit.value() < 1 || *limit.value() > kMaxListLimit) {
      return R::failure(invalid("limit must be between 1 and " + std::to_string(kMaxListLimit)));
    }
    request.limit = *limit.value();
  }
  if (const auto it = query.find("cursor"); it != query.end() && !it->second.empty()) {
    request.cursor = it->second;
  }
  return R::success(std::move(request));
}

} // namespace recollect::gateway
