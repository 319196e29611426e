#pragma once

#include "recollect/common/result.hpp"

#include <string>
#include <string_view>
#include <unordered_map>

namespace recollect::gateway {

struct HttpRequest {
  std::string method;
  std::string path;
  std::string raw_path;
  std::unordered_map<std::string, std::string> headers;
  std::unordered_map<std::string, std::string> query;
  std::string body;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::unordered_map<std::string, std::string> headers;
};

[[nodiscard]] std::string status_text(int status);
[[nodiscard]] std::string url_decode(std::string_view value);
[[nodiscard]] std::unordered_map<std::string, std::string>
parse_query_string(const std::string &query);

/// Headers are keyed lower-case.
[[nodiscard]] common::Result<HttpRequest> parse_http_request(const std::string &raw);
[[nodiscard]] std::string header_lookup(const HttpRequest &request, const std::string &key);
[[nodiscard]] std::string render_http_response(const HttpResponse &response);

[[nodiscard]] HttpResponse make_json_response(int status, std::string body);

/// `{"error":{"code":...,"message":...}}`.
[[nodiscard]] std::string error_json(std::string_view code, const std::string &message);
[[nodiscard]] HttpResponse make_error_response(int status, std::string_view code,
                                               const std::string &message);
/// Status code and error code derived from the status' ErrorCode.
[[nodiscard]] HttpResponse make_error_response(const common::Status &status);

} // namespace recollect::gateway
