#include "test_framework.hpp"

#include "recollect/common/fs.hpp"
#include "recollect/common/json_util.hpp"
#include "recollect/common/result.hpp"
#include "recollect/common/toml.hpp"
#include "recollect/common/worker_pool.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>

void register_common_tests(std::vector<recollect::tests::TestCase> &tests) {
  using recollect::tests::require;
  namespace common = recollect::common;

  tests.push_back({"result_carries_error_code", [] {
                     auto ok = common::Result<int>::success(7);
                     require(ok.ok() && ok.value() == 7, "success should hold value");
                     require(ok.status().ok(), "success status should be ok");

                     auto bad = common::Result<int>::failure(common::ErrorCode::NotFound, "gone");
                     require(!bad.ok(), "failure should not be ok");
                     require(bad.code() == common::ErrorCode::NotFound, "code should survive");
                     require(bad.status().error() == "gone", "message should survive");

                     auto plain = common::Result<int>::failure("boom");
                     require(plain.code() == common::ErrorCode::Internal,
                             "untyped failures are internal");

                     auto rethrown = common::Result<std::string>::failure(bad.status());
                     require(rethrown.code() == common::ErrorCode::NotFound,
                             "status conversion should keep the code");
                   }});

  tests.push_back({"error_code_names_and_http_statuses", [] {
                     require(common::error_code_name(common::ErrorCode::Validation) ==
                                 "validation_error",
                             "validation name");
                     require(common::error_code_name(common::ErrorCode::ConcurrencyConflict) ==
                                 "concurrency_conflict",
                             "conflict name");
                     require(common::error_code_http_status(common::ErrorCode::Validation) == 400,
                             "validation -> 400");
                     require(common::error_code_http_status(common::ErrorCode::NotFound) == 404,
                             "not found -> 404");
                     require(common::error_code_http_status(
                                 common::ErrorCode::ConcurrencyConflict) == 409,
                             "conflict -> 409");
                     require(common::error_code_http_status(
                                 common::ErrorCode::EmbeddingUnavailable) == 503,
                             "unavailable -> 503");
                     require(common::error_code_http_status(common::ErrorCode::EmbeddingTimeout) ==
                                 504,
                             "timeout -> 504");
                     require(common::error_code_http_status(common::ErrorCode::StoreIo) == 500,
                             "store io -> 500");
                   }});

  tests.push_back({"string_helpers", [] {
                     require(common::trim("  hi \n") == "hi", "trim");
                     require(common::trim("   ").empty(), "trim all whitespace");
                     require(common::to_upper("gotcha") == "GOTCHA", "to_upper");
                     require(common::to_lower("GoTcHa") == "gotcha", "to_lower");
                     require(common::starts_with("/records/x", "/records/"), "starts_with");
                     require(common::preview("abcdef", 3) == "abc...", "preview cut");
                     require(common::preview("ab", 3) == "ab", "preview short");
                   }});

  tests.push_back({"expand_path_substitutes_env", [] {
                     recollect::testing::EnvGuard guard("RECOLLECT_TEST_VAR", "xyz");
                     require(common::expand_path("/tmp/${RECOLLECT_TEST_VAR}/a") == "/tmp/xyz/a",
                             "braced variable should expand");
                     require(common::expand_path("$RECOLLECT_TEST_VAR") == "xyz",
                             "bare variable should expand");
                   }});

  tests.push_back({"write_file_atomic_replaces_content", [] {
                     recollect::testing::TempWorkspace workspace;
                     const auto path = workspace.path() / "nested" / "file.bin";
                     require(common::write_file_atomic(path, "first").ok(), "first write");
                     require(common::write_file_atomic(path, "second").ok(), "second write");
                     std::ifstream in(path);
                     std::stringstream buffer;
                     buffer << in.rdbuf();
                     require(buffer.str() == "second", "content should be replaced");
                     require(!std::filesystem::exists(path.string() + ".tmp"),
                             "temp file should be renamed away");
                   }});

  tests.push_back({"json_escape_roundtrip_and_unicode", [] {
                     const std::string raw = "line\n\"quoted\"\ttab\\";
                     require(common::json_unescape(common::json_escape(raw)) == raw,
                             "escape/unescape should round trip");
                     require(common::json_unescape("\\u00e9") == "\xC3\xA9",
                             "\\u escapes should decode to UTF-8");
                     require(common::json_unescape("\\ud83d\\ude00") == "\xF0\x9F\x98\x80",
                             "surrogate pairs should decode");
                   }});

  tests.push_back({"json_field_accessors", [] {
                     const std::string json =
                         R"({"a":"x\"y","n":-1.5e2,"o":{"k":[1,2]},"arr":[{"i":1},{"i":2}],"flag":true,"nul":null})";
                     require(common::json_is_object(json), "should be an object");
                     require(!common::json_is_object("{\"a\":1"), "unbalanced is not an object");
                     require(common::json_get_string(json, "a") == "x\"y", "string field");
                     require(common::json_get_number(json, "n") == "-1.5e2", "number field");
                     require(common::json_get_object(json, "o") == R"({"k":[1,2]})",
                             "object field");
                     const auto items =
                         common::json_split_top_level_objects(common::json_get_array(json, "arr"));
                     require(items.size() == 2, "two array objects");
                     require(common::json_get_number(items[1], "i") == "2", "second item");

                     const auto flat = common::json_parse_flat(json);
                     require(flat.at("a").is_string, "string flagged");
                     require(!flat.at("flag").is_string && flat.at("flag").value == "true",
                             "literal kept raw");
                     require(flat.at("nul").value == "null", "null kept raw");
                   }});

  tests.push_back({"json_parse_float_array_strict", [] {
                     auto ok = common::json_parse_float_array("[0.5, -2, 3e-1]");
                     require(ok.ok(), ok.error());
                     require(ok.value().size() == 3, "three floats");
                     require(ok.value()[1] == -2.0F, "negative integer parsed");
                     require(!common::json_parse_float_array("[1, \"x\"]").ok(),
                             "non-numeric element should fail");
                     require(!common::json_parse_float_array("not-an-array").ok(),
                             "non-array should fail");
                   }});

  tests.push_back({"toml_sections_and_typed_values", [] {
                     auto doc = common::parse_toml(
                         "# comment\n[server]\nport = 9_000\nhost = \"0.0.0.0\" # trailing\n"
                         "[dedup]\nsimilarity_threshold = 0.9\nmerge_context = false\n");
                     require(doc.ok(), doc.error());
                     require(doc.value().get_int("server.port", 0) == 9000, "digit separators");
                     require(doc.value().get_string("server.host") == "0.0.0.0", "quoted string");
                     require(doc.value().get_double("dedup.similarity_threshold", 0.0) == 0.9,
                             "double");
                     require(!doc.value().get_bool("dedup.merge_context", true), "bool");
                     require(doc.value().get_u64("missing.key", 42) == 42, "fallback");
                   }});

  tests.push_back({"worker_pool_runs_all_tasks", [] {
                     std::atomic<int> done{0};
                     {
                       common::WorkerPool pool(4);
                       require(pool.size() == 4, "pool should have four workers");
                       for (int i = 0; i < 100; ++i) {
                         require(pool.submit([&done] { ++done; }), "submit should succeed");
                       }
                       pool.stop();
                       require(!pool.submit([] {}), "submit after stop should fail");
                     }
                     require(done.load() == 100, "every queued task should run");
                   }});

  tests.push_back({"worker_pool_rejects_when_queue_full", [] {
                     std::atomic<bool> started{false};
                     std::atomic<bool> release{false};
                     std::atomic<int> done{0};
                     {
                       common::WorkerPool pool(1, 2);
                       require(pool.submit([&] {
                         started = true;
                         while (!release.load()) {
                           std::this_thread::yield();
                         }
                         ++done;
                       }),
                               "first task accepted");
                       while (!started.load()) {
                         std::this_thread::yield();
                       }
                       require(pool.submit([&done] { ++done; }), "queue slot one");
                       require(pool.submit([&done] { ++done; }), "queue slot two");
                       require(pool.pending() == 2, "two tasks waiting");
                       require(!pool.submit([&done] { ++done; }), "full queue rejects");
                       release = true;
                       pool.stop();
                     }
                     require(done.load() == 3, "accepted tasks all ran");
                   }});
}
