#include "test_framework.hpp"

#include "recollect/client/daemon_client.hpp"
#include "recollect/common/fs.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>
#include <sstream>

namespace {

using recollect::testing::MockHttpClient;

std::shared_ptr<MockHttpClient> mock() { return std::make_shared<MockHttpClient>(); }

} // namespace

void register_client_tests(std::vector<recollect::tests::TestCase> &tests) {
  using recollect::tests::require;
  namespace common = recollect::common;
  namespace client = recollect::client;

  tests.push_back({"client_builds_urls_and_requests", [] {
                     auto http = mock();
                     http->push_json(200, R"({"status":"ok"})");
                     http->push_json(200, R"({"id":"lrn_1","created":true})");
                     http->push_json(200, R"({"records":[]})");
                     http->push_json(200, R"({"deleted":true})");
                     http->push_json(200, R"({"indexed":0})");
                     client::DaemonClient daemon("127.0.0.1", 9001, 1500, http);
                     require(daemon.base_url() == "http://127.0.0.1:9001", "base url");

                     require(daemon.health().ok(), "health");
                     auto stored = daemon.store(R"({"type":"pattern"})");
                     require(stored.ok() && stored.value() == R"({"id":"lrn_1","created":true})",
                             "body passed through");
                     require(daemon.list("type=pattern&limit=5").ok(), "list");
                     require(daemon.forget("lrn/1 x").ok(), "forget");
                     require(daemon.reindex().ok(), "reindex");

                     const auto requests = http->requests();
                     require(requests.size() == 5, "five requests");
                     require(requests[0].method == "GET" &&
                                 requests[0].url == "http://127.0.0.1:9001/health",
                             "health request");
                     require(requests[1].method == "POST" &&
                                 requests[1].url == "http://127.0.0.1:9001/store",
                             "store request");
                     require(requests[1].headers.at("Content-Type") == "application/json",
                             "json content type");
                     require(requests[1].body == R"({"type":"pattern"})", "store body");
                     require(requests[1].timeout_ms == 1500, "timeout forwarded");
                     require(requests[2].url ==
                                 "http://127.0.0.1:9001/records?type=pattern&limit=5",
                             "list query string");
                     require(requests[3].method == "DELETE" &&
                                 requests[3].url == "http://127.0.0.1:9001/records/lrn%2F1%20x",
                             "id url-encoded");
                     require(requests[4].url == "http://127.0.0.1:9001/reindex", "reindex url");
                   }});

  tests.push_back({"client_maps_daemon_errors", [] {
                     auto http = mock();
                     http->push_json(404, R"({"error":{"code":"not_found","message":"no lrn_x"}})");
                     http->push_json(
                         503, R"({"error":{"code":"embedding_unavailable","message":"down"}})");
                     http->push_json(409, R"({"error":{"code":"concurrency_conflict","message":"busy"}})");
                     http->push_json(500, "");
                     client::DaemonClient daemon("127.0.0.1", 9001, 1000, http);

                     auto missing = daemon.get("lrn_x");
                     require(missing.code() == common::ErrorCode::NotFound, "not found");
                     require(missing.error() == "no lrn_x", "message kept");
                     require(daemon.store("{}").code() == common::ErrorCode::EmbeddingUnavailable,
                             "embedding unavailable");
                     require(daemon.store("{}").code() == common::ErrorCode::ConcurrencyConflict,
                             "conflict");
                     auto bare = daemon.stats();
                     require(bare.code() == common::ErrorCode::Internal, "unknown maps to internal");
                     require(bare.error() == "HTTP 500", "status used when body is empty");
                   }});

  tests.push_back({"client_reports_unreachable_daemon", [] {
                     auto http = mock();
                     client::DaemonClient daemon("127.0.0.1", 9001, 1000, http);
                     auto health = daemon.health();
                     require(!health.ok(), "fails");
                     require(common::starts_with(health.error(), "cannot reach"),
                             "unreachable message");
                   }});

  tests.push_back({"client_import_jsonl_counts_lines", [] {
                     recollect::testing::TempWorkspace workspace;
                     workspace.create_file(
                         "learnings.jsonl",
                         "# exported learnings\n"
                         R"({"type":"pattern","content":"a","confidence":0.9})"
                         "\n\n"
                         R"({"type":"pattern","content":"a again","confidence":0.9})"
                         "\n"
                         "not json\n"
                         R"({"type":"pattern","content":"low","confidence":0.1})"
                         "\n");
                     auto http = mock();
                     http->push_json(200, R"({"id":"lrn_1","created":true,"status":"stored"})");
                     http->push_json(200, R"({"id":"lrn_1","created":false,"status":"duplicate"})");
                     http->push_json(400, R"({"error":{"code":"validation_error","message":"too low"}})");
                     client::DaemonClient daemon("127.0.0.1", 9001, 1000, http);

                     std::ostringstream progress;
                     auto summary =
                         daemon.import_jsonl(workspace.path() / "learnings.jsonl", &progress);
                     require(summary.ok(), summary.error());
                     require(summary.value().imported == 1, "one imported");
                     require(summary.value().duplicates == 1, "one duplicate");
                     require(summary.value().errors == 2, "bad json and rejected line");
                     require(summary.value().skipped == 2, "comment and blank line");
                     require(http->requests().size() == 3, "only object lines are sent");
                     require(progress.str().find("line 5: not a JSON object") != std::string::npos,
                             "line numbers reported");
                     require(progress.str().find("line 6: too low") != std::string::npos,
                             "daemon message reported");
                   }});

  tests.push_back({"client_import_jsonl_failures", [] {
                     recollect::testing::TempWorkspace workspace;
                     client::DaemonClient daemon("127.0.0.1", 9001, 1000, mock());
                     require(daemon.import_jsonl(workspace.path() / "missing.jsonl").code() ==
                                 common::ErrorCode::NotFound,
                             "missing file");

                     workspace.create_file("one.jsonl",
                                           R"({"type":"pattern","content":"a","confidence":0.9})"
                                           "\n");
                     auto unreachable = daemon.import_jsonl(workspace.path() / "one.jsonl");
                     require(!unreachable.ok(), "unreachable daemon aborts the import");
                     require(common::starts_with(unreachable.error(), "cannot reach"),
                             "unreachable message");
                   }});
}
