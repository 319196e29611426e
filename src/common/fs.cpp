#include "recollect/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <regex>

#ifndef _WIN32
#include <fcntl.h>
#include <unistd.h>
#else
#include <fstream>
#endif

namespace recollect::common {

std::string_view error_code_name(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return "ok";
  case ErrorCode::Validation:
    return "validation_error";
  case ErrorCode::NotFound:
    return "not_found";
  case ErrorCode::EmbeddingUnavailable:
    return "embedding_unavailable";
  case ErrorCode::EmbeddingTimeout:
    return "embedding_timeout";
  case ErrorCode::StoreIo:
    return "store_io_error";
  case ErrorCode::ConcurrencyConflict:
    return "concurrency_conflict";
  case ErrorCode::Internal:
    return "internal_error";
  }
  return "internal_error";
}

int error_code_http_status(const ErrorCode code) {
  switch (code) {
  case ErrorCode::None:
    return 200;
  case ErrorCode::Validation:
    return 400;
  case ErrorCode::NotFound:
    return 404;
  case ErrorCode::ConcurrencyConflict:
    return 409;
  case ErrorCode::EmbeddingUnavailable:
    return 503;
  case ErrorCode::EmbeddingTimeout:
    return 504;
  case ErrorCode::StoreIo:
  case ErrorCode::Internal:
    return 500;
  }
  return 500;
}

std::string trim(const std::string &input) {
  auto first = std::find_if_not(input.begin(), input.end(), [](unsigned char c) {
    return std::isspace(c) != 0;
  });
  auto last = std::find_if_not(input.rbegin(), input.rend(), [](unsigned char c) {
    return std::isspace(c) != 0;
  }).base();

  if (first >= last) {
    return "";
  }
  return std::string(first, last);
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.rfind(prefix, 0) == 0;
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return value;
}

std::string to_upper(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
    return static_cast<char>(std::toupper(c));
  });
  return value;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  return Result<std::filesystem::path>::failure("HOME is not set");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure(
        ErrorCode::StoreIo, "Failed to create directory: " + path.string() + ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

std::string expand_path(std::string value) {
  if (value.empty()) {
    return value;
  }

  if (value[0] == '~') {
    if (auto home = home_dir(); home.ok()) {
      value.replace(0, 1, home.value().string());
    }
  }

  std::regex env_pattern(R"(\$\{?([A-Za-z_][A-Za-z0-9_]*)\}?)");
  std::smatch match;
  std::string expanded;
  std::string remaining = value;

  while (std::regex_search(remaining, match, env_pattern)) {
    expanded += match.prefix().str();
    const std::string var_name = match[1].str();
    if (const char *var = std::getenv(var_name.c_str()); var != nullptr) {
      expanded += var;
    }
    remaining = match.suffix().str();
  }

  expanded += remaining;
  return expanded;
}

Status write_file_atomic(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return Status::error(ErrorCode::StoreIo,
                           "failed to create " + path.parent_path().string() + ": " + ec.message());
    }
  }

  const std::string temp_path = path.string() + ".tmp";
#ifndef _WIN32
  const int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
  if (fd < 0) {
    return Status::error(ErrorCode::StoreIo,
                         "open " + temp_path + " failed: " + std::strerror(errno));
  }
  std::size_t written = 0;
  while (written < content.size()) {
    const ssize_t n = ::write(fd, content.data() + written, content.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      const std::string msg = std::strerror(errno);
      ::close(fd);
      std::filesystem::remove(temp_path, ec);
      return Status::error(ErrorCode::StoreIo, "write " + temp_path + " failed: " + msg);
    }
    written += static_cast<std::size_t>(n);
  }
  if (::fsync(fd) != 0) {
    const std::string msg = std::strerror(errno);
    ::close(fd);
    std::filesystem::remove(temp_path, ec);
    return Status::error(ErrorCode::StoreIo, "fsync " + temp_path + " failed: " + msg);
  }
  ::close(fd);
#else
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      return Status::error(ErrorCode::StoreIo, "open " + temp_path + " failed");
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
      return Status::error(ErrorCode::StoreIo, "write " + temp_path + " failed");
    }
  }
#endif

  std::filesystem::rename(temp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(temp_path, ignored);
    return Status::error(ErrorCode::StoreIo,
                         "rename to " + path.string() + " failed: " + ec.message());
  }
  return Status::success();
}

std::string preview(const std::string &text, const std::size_t max_chars) {
  std::string out = trim(text);
  if (out.size() > max_chars) {
    out.resize(max_chars);
    out += "...";
  }
  return out;
}

} // namespace recollect::common
