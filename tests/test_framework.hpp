#pragma once

#include "recollect/common/result.hpp"

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace recollect::tests {

/// One named case; `fn` fails by throwing, usually through require().
struct TestCase {
  std::string name;
  std::function<void()> fn;
};

inline void require(bool condition, const std::string &message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

/// Fails unless `result` carries exactly `code`; the message names the code seen.
template <typename R>
void require_code(const R &result, const common::ErrorCode code, const std::string &message) {
  if (result.code() != code) {
    throw std::runtime_error(message + " (got " + std::string(common::error_code_name(result.code())) +
                             ": " + result.error() + ")");
  }
}

} // namespace recollect::tests
