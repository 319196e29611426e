#pragma once

#include "recollect/common/http_client.hpp"
#include "recollect/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <iosfwd>
#include <memory>
#include <string>

namespace recollect::client {

struct ImportSummary {
  std::size_t imported = 0;
  std::size_t duplicates = 0;
  std::size_t errors = 0;
  std::size_t skipped = 0;
};

/// Thin HTTP client for a running daemon. Successful calls return the
/// response body. Error responses fail with the daemon's error code and
/// message; an unreachable daemon fails with a "cannot reach" message.
class DaemonClient {
public:
  DaemonClient(std::string host, std::uint16_t port, std::uint64_t timeout_ms = 30'000,
               std::shared_ptr<common::HttpClient> http_client =
                   std::make_shared<common::CurlHttpClient>());

  [[nodiscard]] const std::string &base_url() const { return base_url_; }

  [[nodiscard]] common::Result<std::string> health();
  [[nodiscard]] common::Result<std::string> store(const std::string &learning_json);
  [[nodiscard]] common::Result<std::string> query(const std::string &query_json);
  [[nodiscard]] common::Result<std::string> stats();
  [[nodiscard]] common::Result<std::string> list(const std::string &query_string);
  [[nodiscard]] common::Result<std::string> get(const std::string &id);
  [[nodiscard]] common::Result<std::string> forget(const std::string &id);
  [[nodiscard]] common::Result<std::string> purge();
  [[nodiscard]] common::Result<std::string> reindex();

  /// Stream a JSONL file to `/store`, one learning per line. Blank lines and
  /// `#` comments are skipped; per-line failures are counted, not fatal.
  [[nodiscard]] common::Result<ImportSummary> import_jsonl(const std::filesystem::path &path,
                                                           std::ostream *progress = nullptr);

private:
  [[nodiscard]] common::Result<std::string> finish(const common::HttpResponse &response) const;

  std::string base_url_;
  std::uint64_t timeout_ms_;
  std::shared_ptr<common::HttpClient> http_client_;
};

} // namespace recollect::client
