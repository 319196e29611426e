#pragma once

#include "recollect/common/result.hpp"

#include <filesystem>
#include <string>

namespace recollect::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] std::string to_upper(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Write `content` to a sibling temp file, fsync it, then rename over `path`.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

/// Shorten to at most `max_chars` bytes, appending "..." when cut.
[[nodiscard]] std::string preview(const std::string &text, std::size_t max_chars);

} // namespace recollect::common
