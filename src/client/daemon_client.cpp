#include "recollect/client/daemon_client.hpp"

#include "recollect/common/fs.hpp"
#include "recollect/common/json_util.hpp"

#include <cctype>
#include <fstream>
#include <ostream>

namespace recollect::client {

namespace {

const common::HttpHeaders kJsonHeaders = {{"Content-Type", "application/json"}};

common::ErrorCode code_from_name(const std::string &name) {
  for (const auto code :
       {common::ErrorCode::Validation, common::ErrorCode::NotFound,
        common::ErrorCode::EmbeddingUnavailable, common::ErrorCode::EmbeddingTimeout,
        common::ErrorCode::StoreIo, common::ErrorCode::ConcurrencyConflict}) {
    if (common::error_code_name(code) == name) {
      return code;
    }
  }
  return common::ErrorCode::Internal;
}

std::string url_encode(const std::string &value) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  for (const char raw : value) {
    const auto c = static_cast<unsigned char>(raw);
    if (std::isalnum(c) != 0 || c == '-' || c == '_' || c == '.' || c == '~') {
      out.push_back(raw);
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4U]);
      out.push_back(kHex[c & 0x0FU]);
    }
  }
  return out;
}

} // namespace

DaemonClient::DaemonClient(std::string host, const std::uint16_t port,
                           const std::uint64_t timeout_ms,
                           std::shared_ptr<common::HttpClient> http_client)
    : base_url_("http://" + std::move(host) + ":" + std::to_string(port)),
      timeout_ms_(timeout_ms), http_client_(std::move(http_client)) {}

common::Result<std::string> DaemonClient::finish(const common::HttpResponse &response) const {
  using R = common::Result<std::string>;
  if (response.network_error) {
    return R::failure("cannot reach recollect daemon at " + base_url_ + ": " +
                      response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    const std::string error = common::json_get_object(response.body, "error");
    std::string message = common::json_get_string(error, "message");
    if (message.empty()) {
      message = response.body.empty() ? "HTTP " + std::to_string(response.status) : response.body;
    }
    return R::failure(code_from_name(common::json_get_string(error, "code")), message);
  }
  return R::success(response.body);
}

common::Result<std::string> DaemonClient::health() {
  return finish(http_client_->get(base_url_ + "/health", {}, timeout_ms_));
}

common::Result<std::string> DaemonClient::store(const std::string &learning_json) {
  return finish(http_client_->post_json(base_url_ + "/store", kJsonHeaders, learning_json,
                                        timeout_ms_));
}

common::Result<std::string> DaemonClient::query(const std::string &query_json) {
  return finish(
      http_client_->post_json(base_url_ + "/query", kJsonHeaders, query_json, timeout_ms_));
}

common::Result<std::string> DaemonClient::stats() {
  return finish(http_client_->get(base_url_ + "/stats", {}, timeout_ms_));
}

common::Result<std::string> DaemonClient::list(const std::string &query_string) {
  const std::string url =
      base_url_ + "/records" + (query_string.empty() ? "" : "?" + query_string);
  return finish(http_client_->get(url, {}, timeout_ms_));
}

common::Result<std::string> DaemonClient::get(const std::string &id) {
  return finish(http_client_->get(base_url_ + "/records/" + url_encode(id), {}, timeout_ms_));
}

common::Result<std::string> DaemonClient::forget(const std::string &id) {
  return finish(http_client_->del(base_url_ + "/records/" + url_encode(id), {}, timeout_ms_));
}

common::Result<std::string> DaemonClient::purge() {
  return finish(http_client_->post_json(base_url_ + "/purge", kJsonHeaders, "{}", timeout_ms_));
}

common::Result<std::string> DaemonClient::reindex() {
  return finish(
      http_client_->post_json(base_url_ + "/reindex", kJsonHeaders, "{}", timeout_ms_));
}

common::Result<ImportSummary> DaemonClient::import_jsonl(const std::filesystem::path &path,
                                                         std::ostream *progress) {
  using R = common::Result<ImportSummary>;
  std::ifstream in(path);
  if (!in) {
    return R::failure(common::ErrorCode::NotFound, "cannot open " + path.string());
  }

  ImportSummary summary;
  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    const std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      ++summary.skipped;
      continue;
    }
    if (!common::json_is_object(trimmed)) {
      ++summary.errors;
      if (progress != nullptr) {
        *progress << "line " << line_no << ": not a JSON object\n";
      }
      continue;
    }

    auto stored = store(trimmed);
    if (!stored.ok()) {
      // An unreachable daemon fails every remaining line the same way.
      if (stored.code() == common::ErrorCode::Internal &&
          common::starts_with(stored.error(), "cannot reach")) {
        return R::failure(stored.status());
      }
      ++summary.errors;
      if (progress != nullptr) {
        *progress << "line " << line_no << ": " << stored.error() << "\n";
      }
      continue;
    }

    if (common::json_get_string(stored.value(), "status") == "duplicate") {
      ++summary.duplicates;
    } else {
      ++summary.imported;
    }
  }
  return R::success(summary);
}

} // namespace recollect::client
