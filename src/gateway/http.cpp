#include "recollect/gateway/http.hpp"

#include "recollect/common/fs.hpp"
#include "recollect/common/json_util.hpp"

#include <sstream>

namespace recollect::gateway {

namespace {

int hex_value(const char c) {
  if (c >= '0' && c <= '9') {
    return c - '0';
  }
  if (c >= 'a' && c <= 'f') {
    return c - 'a' + 10;
  }
  if (c >= 'A' && c <= 'F') {
    return c - 'A' + 10;
  }
  return -1;
}

} // namespace

std::string status_text(const int status) {
  switch (status) {
  case 200:
    return "OK";
  case 400:
    return "Bad Request";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 409:
    return "Conflict";
  case 413:
    return "Payload Too Large";
  case 500:
    return "Internal Server Error";
  case 503:
    return "Service Unavailable";
  case 504:
    return "Gateway Timeout";
  default:
    return "OK";
  }
}

std::string url_decode(const std::string_view value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char c = value[i];
    if (c == '+') {
      out.push_back(' ');
    } else if (c == '%' && i + 2 < value.size() && hex_value(value[i + 1]) >= 0 &&
               hex_value(value[i + 2]) >= 0) {
      out.push_back(static_cast<char>(hex_value(value[i + 1]) * 16 + hex_value(value[i + 2])));
      i += 2;
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::unordered_map<std::string, std::string> parse_query_string(const std::string &query) {
  std::unordered_map<std::string, std::string> out;
  std::stringstream stream(query);
  std::string part;
  while (std::getline(stream, part, '&')) {
    if (part.empty()) {
      continue;
    }
    const auto eq = part.find('=');
    if (eq == std::string::npos) {
      out[url_decode(part)] = "";
      continue;
    }
    out[url_decode(std::string_view(part).substr(0, eq))] =
        url_decode(std::string_view(part).substr(eq + 1));
  }
  return out;
}

common::Result<HttpRequest> parse_http_request(const std::string &raw) {
  const auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return common::Result<HttpRequest>::failure(common::ErrorCode::Validation,
                                                "incomplete request");
  }

  const std::string headers_part = raw.substr(0, header_end);
  const std::string body = raw.substr(header_end + 4);

  std::istringstream head_stream(headers_part);
  std::string line;
  if (!std::getline(head_stream, line)) {
    return common::Result<HttpRequest>::failure(common::ErrorCode::Validation,
                                                "missing request line");
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  std::istringstream req_line(line);
  HttpRequest request;
  std::string http_version;
  if (!(req_line >> request.method >> request.raw_path >> http_version)) {
    return common::Result<HttpRequest>::failure(common::ErrorCode::Validation,
                                                "invalid request line");
  }

  while (std::getline(head_stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    const std::string key = common::to_lower(common::trim(line.substr(0, colon)));
    request.headers[key] = common::trim(line.substr(colon + 1));
  }

  request.body = body;
  const auto qpos = request.raw_path.find('?');
  if (qpos == std::string::npos) {
    request.path = request.raw_path;
  } else {
    request.path = request.raw_path.substr(0, qpos);
    request.query = parse_query_string(request.raw_path.substr(qpos + 1));
  }

  return common::Result<HttpRequest>::success(std::move(request));
}

std::string header_lookup(const HttpRequest &request, const std::string &key) {
  const auto it = request.headers.find(common::to_lower(key));
  return it == request.headers.end() ? "" : it->second;
}

std::string render_http_response(const HttpResponse &response) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";
  out << "Content-Type: " << response.content_type << "\r\n";
  out << "Content-Length: " << response.body.size() << "\r\n";
  out << "Connection: close\r\n";
  for (const auto &[k, v] : response.headers) {
    out << k << ": " << v << "\r\n";
  }
  out << "\r\n";
  out << response.body;
  return out.str();
}

HttpResponse make_json_response(const int status, std::string body) {
  HttpResponse response;
  response.status = status;
  response.content_type = "application/json";
  response.body = std::move(body);
  return response;
}

std::string error_json(const std::string_view code, const std::string &message) {
  return "{\"error\":{\"code\":\"" + common::json_escape(std::string(code)) +
         "\",\"message\":\"" + common::json_escape(message) + "\"}}";
}

HttpResponse make_error_response(const int status, const std::string_view code,
                                 const std::string &message) {
  return make_json_response(status, error_json(code, message));
}

HttpResponse make_error_response(const common::Status &status) {
  return make_error_response(common::error_code_http_status(status.code()),
                             common::error_code_name(status.code()), status.error());
}

} // namespace recollect::gateway
