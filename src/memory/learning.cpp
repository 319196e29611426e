#include "recollect/memory/learning.hpp"

#include "recollect/common/fs.hpp"

#include <openssl/rand.h>

#include <chrono>
#include <cmath>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace recollect::memory {

std::string type_to_string(const LearningType type) {
  switch (type) {
  case LearningType::WorkingSolution:
    return "WORKING_SOLUTION";
  case LearningType::Gotcha:
    return "GOTCHA";
  case LearningType::Pattern:
    return "PATTERN";
  case LearningType::Decision:
    return "DECISION";
  case LearningType::Failure:
    return "FAILURE";
  case LearningType::Preference:
    return "PREFERENCE";
  }
  return "PATTERN";
}

std::optional<LearningType> type_from_string(std::string_view value) {
  const std::string normalized = common::to_upper(common::trim(std::string(value)));
  for (const auto type : kAllLearningTypes) {
    if (type_to_string(type) == normalized) {
      return type;
    }
  }
  return std::nullopt;
}

common::Status validate_draft(const LearningDraft &draft, const double admission_threshold) {
  if (common::trim(draft.content).empty()) {
    return common::Status::error(common::ErrorCode::Validation, "content must not be empty");
  }
  if (!std::isfinite(draft.confidence) || draft.confidence < 0.0 || draft.confidence > 1.0) {
    return common::Status::error(common::ErrorCode::Validation,
                                 "confidence must be between 0.0 and 1.0");
  }
  if (draft.confidence < admission_threshold) {
    std::ostringstream message;
    message << "confidence " << draft.confidence << " is below the admission threshold "
            << admission_threshold;
    return common::Status::error(common::ErrorCode::Validation, message.str());
  }
  return common::Status::success();
}

std::string embedding_text(const std::string &content, const std::string &context,
                           const bool include_context) {
  if (!include_context || common::trim(context).empty()) {
    return content;
  }
  return content + "\n" + context;
}

std::string now_rfc3339() {
  const auto now = std::chrono::system_clock::now();
  const auto t = std::chrono::system_clock::to_time_t(now);
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  gmtime_r(&t, &tm);

  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return out.str();
}

common::Result<std::string> generate_learning_id() {
  unsigned char bytes[16];
  if (RAND_bytes(bytes, sizeof(bytes)) != 1) {
    return common::Result<std::string>::failure("RAND_bytes failed");
  }
  std::ostringstream out;
  out << "lrn_" << std::hex << std::setfill('0');
  for (const unsigned char b : bytes) {
    out << std::setw(2) << static_cast<int>(b);
  }
  return common::Result<std::string>::success(out.str());
}

} // namespace recollect::memory
