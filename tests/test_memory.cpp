#include "test_framework.hpp"

#include "recollect/memory/learning.hpp"
#include "recollect/memory/record_store.hpp"
#include "recollect/memory/similarity_index.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <cmath>
#include <fstream>
#include <set>
#include <thread>

namespace {

namespace mem = recollect::memory;
using recollect::testing::axis_vector;
using recollect::testing::make_draft;

constexpr std::size_t kDims = 8;

std::unique_ptr<mem::RecordStore> open_store(const std::filesystem::path &dir,
                                             const double admission = 0.7) {
  auto store = std::make_unique<mem::RecordStore>(dir / "learnings.db", admission);
  auto status = store->open(kDims);
  if (!status.ok()) {
    throw std::runtime_error("store open failed: " + status.error());
  }
  return store;
}

} // namespace

void register_memory_tests(std::vector<recollect::tests::TestCase> &tests) {
  using recollect::tests::require;
  using recollect::testing::TempWorkspace;
  namespace common = recollect::common;

  tests.push_back({"learning_type_names_roundtrip", [] {
                     for (const auto type : mem::kAllLearningTypes) {
                       const auto parsed = mem::type_from_string(mem::type_to_string(type));
                       require(parsed.has_value() && *parsed == type, "type should round trip");
                     }
                     require(mem::type_from_string("working_solution") ==
                                 mem::LearningType::WorkingSolution,
                             "lower case accepted");
                     require(mem::type_from_string(" gotcha ") == mem::LearningType::Gotcha,
                             "surrounding whitespace accepted");
                     require(!mem::type_from_string("HUNCH").has_value(), "unknown rejected");
                   }});

  tests.push_back({"learning_draft_validation", [] {
                     const auto ok = make_draft(mem::LearningType::Pattern, "use WAL", 0.8);
                     require(mem::validate_draft(ok, 0.7).ok(), "valid draft");

                     auto empty = make_draft(mem::LearningType::Pattern, "   ", 0.8);
                     require(mem::validate_draft(empty, 0.7).code() ==
                                 common::ErrorCode::Validation,
                             "blank content rejected");

                     auto high = make_draft(mem::LearningType::Pattern, "x", 1.2);
                     require(!mem::validate_draft(high, 0.0).ok(), "confidence > 1 rejected");

                     auto nan = make_draft(mem::LearningType::Pattern, "x", std::nan(""));
                     require(!mem::validate_draft(nan, 0.0).ok(), "NaN confidence rejected");

                     auto low = make_draft(mem::LearningType::Pattern, "x", 0.69);
                     require(!mem::validate_draft(low, 0.7).ok(), "below admission rejected");
                     auto edge = make_draft(mem::LearningType::Pattern, "x", 0.7);
                     require(mem::validate_draft(edge, 0.7).ok(), "admission is inclusive");
                   }});

  tests.push_back({"learning_ids_and_timestamps", [] {
                     std::set<std::string> ids;
                     for (int i = 0; i < 100; ++i) {
                       auto id = mem::generate_learning_id();
                       require(id.ok(), id.error());
                       require(id.value().size() == 36 && id.value().rfind("lrn_", 0) == 0,
                               "id shape");
                       ids.insert(id.value());
                     }
                     require(ids.size() == 100, "ids should be unique");

                     const auto ts = mem::now_rfc3339();
                     require(ts.size() == 24 && ts.back() == 'Z' && ts[19] == '.',
                             "millisecond RFC3339 timestamp expected");
                   }});

  tests.push_back({"learning_embedding_text_context_toggle", [] {
                     require(mem::embedding_text("content", "ctx", false) == "content",
                             "context excluded by default");
                     require(mem::embedding_text("content", "ctx", true) == "content\nctx",
                             "context appended when enabled");
                     require(mem::embedding_text("content", "  ", true) == "content",
                             "blank context ignored");
                   }});

  tests.push_back({"record_store_create_get_update", [] {
                     TempWorkspace workspace;
                     auto store = open_store(workspace.path());
                     auto created = store->create(
                         make_draft(mem::LearningType::Gotcha, "sqlite needs busy_timeout", 0.8,
                                    "seen under load", "session-1"),
                         axis_vector(kDims, 0));
                     require(created.ok(), created.error());
                     const auto &record = created.value();
                     require(record.merge_count == 1 && !record.archived, "fresh record");
                     require(record.created_at == record.updated_at, "timestamps start equal");

                     auto fetched = store->get(record.id);
                     require(fetched.ok(), fetched.error());
                     require(fetched.value().content == "sqlite needs busy_timeout", "content");
                     require(fetched.value().context == "seen under load", "context");
                     require(fetched.value().session_source == "session-1", "session");
                     require(fetched.value().type == mem::LearningType::Gotcha, "type");
                     require(fetched.value().embedding == axis_vector(kDims, 0),
                             "embedding should round trip bit-exact");

                     std::this_thread::sleep_for(std::chrono::milliseconds(5));
                     mem::RecordPatch patch;
                     patch.confidence = 0.95;
                     patch.merge_count = 2;
                     auto updated = store->update(record.id, patch);
                     require(updated.ok(), updated.error());
                     require(updated.value().confidence == 0.95, "confidence patched");
                     require(updated.value().merge_count == 2, "merge count patched");
                     require(updated.value().content == record.content, "content untouched");
                     require(updated.value().created_at == record.created_at,
                             "created_at is immutable");
                     require(updated.value().updated_at > record.updated_at,
                             "updated_at advances");
                   }});

  tests.push_back({"record_store_rejects_invalid_input", [] {
                     TempWorkspace workspace;
                     auto store = open_store(workspace.path());
                     auto low = store->create(make_draft(mem::LearningType::Pattern, "x", 0.5),
                                              axis_vector(kDims, 0));
                     require(low.code() == common::ErrorCode::Validation,
                             "below admission threshold");
                     auto wrong_dims = store->create(make_draft(mem::LearningType::Pattern, "x"),
                                                     std::vector<float>(3, 1.0F));
                     require(wrong_dims.code() == common::ErrorCode::Validation,
                             "dimension mismatch");
                     auto missing = store->get("lrn_missing");
                     require(missing.code() == common::ErrorCode::NotFound, "unknown id");
                     mem::RecordPatch patch;
                     patch.confidence = 0.9;
                     require(store->update("lrn_missing", patch).code() ==
                                 common::ErrorCode::NotFound,
                             "update of unknown id");
                     patch.content = " ";
                     auto created = store->create(make_draft(mem::LearningType::Pattern, "y"),
                                                  axis_vector(kDims, 1));
                     require(created.ok(), created.error());
                     require(store->update(created.value().id, patch).code() ==
                                 common::ErrorCode::Validation,
                             "blank content patch rejected");
                   }});

  tests.push_back({"record_store_persists_and_checks_dimensions", [] {
                     TempWorkspace workspace;
                     std::string id;
                     {
                       auto store = open_store(workspace.path());
                       auto created = store->create(make_draft(mem::LearningType::Decision,
                                                               "pick sqlite"),
                                                    axis_vector(kDims, 2));
                       require(created.ok(), created.error());
                       id = created.value().id;
                     }
                     auto reopened = open_store(workspace.path());
                     require(reopened->get(id).ok(), "record should survive reopen");
                     reopened->close();

                     mem::RecordStore other(workspace.path() / "learnings.db", 0.7);
                     auto status = other.open(kDims * 2);
                     require(!status.ok(), "different dimensionality must be refused");
                     require(status.code() == common::ErrorCode::Validation, "validation code");
                   }});

  tests.push_back({"record_store_keyset_pagination", [] {
                     TempWorkspace workspace;
                     auto store = open_store(workspace.path());
                     for (int i = 0; i < 7; ++i) {
                       auto created = store->create(
                           make_draft(i % 2 == 0 ? mem::LearningType::Pattern
                                                 : mem::LearningType::Failure,
                                      "learning " + std::to_string(i)),
                           axis_vector(kDims, static_cast<std::size_t>(i)));
                       require(created.ok(), created.error());
                     }

                     std::vector<std::string> seen;
                     std::optional<std::string> cursor;
                     std::size_t pages = 0;
                     do {
                       auto page = store->list_page(mem::RecordFilter{}, 3, cursor);
                       require(page.ok(), page.error());
                       for (const auto &record : page.value().records) {
                         seen.push_back(record.content);
                       }
                       cursor = page.value().next_cursor;
                       ++pages;
                     } while (cursor.has_value());
                     require(pages == 3, "7 records in pages of 3");
                     require(seen.size() == 7, "every record listed once");
                     require(seen.front() == "learning 6" && seen.back() == "learning 0",
                             "newest first");

                     mem::RecordFilter failures;
                     failures.type = mem::LearningType::Failure;
                     auto filtered = store->list_page(failures, 50, std::nullopt);
                     require(filtered.ok(), filtered.error());
                     require(filtered.value().records.size() == 3, "type filter");
                     require(!filtered.value().next_cursor.has_value(), "no further page");

                     require(store->list_page(mem::RecordFilter{}, 3, std::string("garbage"))
                                     .code() == common::ErrorCode::Validation,
                             "malformed cursor rejected");

                     auto cursor_walk = store->list(mem::RecordFilter{}, 2);
                     std::size_t walked = 0;
                     while (true) {
                       auto next = cursor_walk.next();
                       require(next.ok(), next.error());
                       if (!next.value().has_value()) {
                         break;
                       }
                       ++walked;
                     }
                     require(walked == 7, "cursor should visit every record");
                   }});

  tests.push_back({"record_store_soft_delete_and_purge", [] {
                     TempWorkspace workspace;
                     auto store = open_store(workspace.path());
                     auto keep = store->create(make_draft(mem::LearningType::Pattern, "keep"),
                                               axis_vector(kDims, 0));
                     auto drop = store->create(make_draft(mem::LearningType::Gotcha, "drop"),
                                               axis_vector(kDims, 1));
                     require(keep.ok() && drop.ok(), "creates");

                     auto removed = store->remove(drop.value().id);
                     require(removed.ok() && removed.value(), "first remove archives");
                     auto again = store->remove(drop.value().id);
                     require(again.ok() && !again.value(), "second remove is a no-op");
                     auto unknown = store->remove("lrn_unknown");
                     require(unknown.ok() && !unknown.value(), "unknown id is a no-op");

                     auto archived = store->get(drop.value().id);
                     require(archived.ok() && archived.value().archived,
                             "archived record still readable");

                     auto stats = store->stats();
                     require(stats.ok(), stats.error());
                     require(stats.value().total == 1 && stats.value().archived == 1, "counts");
                     require(stats.value().by_type[static_cast<std::size_t>(
                                 mem::LearningType::Pattern)] == 1,
                             "by type excludes archived");

                     auto versions = store->active_versions();
                     require(versions.ok() && versions.value().size() == 1, "one active version");

                     auto visible = store->list_page(mem::RecordFilter{}, 10, std::nullopt);
                     require(visible.ok() && visible.value().records.size() == 1,
                             "archived hidden by default");
                     mem::RecordFilter all;
                     all.include_archived = true;
                     auto everything = store->list_page(all, 10, std::nullopt);
                     require(everything.ok() && everything.value().records.size() == 2,
                             "include_archived lists both");

                     auto purged = store->purge();
                     require(purged.ok() && purged.value() == 1, "one purged");
                     require(store->get(drop.value().id).code() == common::ErrorCode::NotFound,
                             "purged record is gone");
                   }});

  tests.push_back({"record_store_closed_reports_store_io", [] {
                     TempWorkspace workspace;
                     auto store = open_store(workspace.path());
                     store->close();
                     require(!store->is_open(), "closed");
                     require(store->get("lrn_x").code() == common::ErrorCode::StoreIo,
                             "closed store reports store io");
                   }});

  tests.push_back({"cosine_similarity_edges", [] {
                     require(std::abs(mem::cosine_similarity({1, 0}, {1, 0}) - 1.0) < 1e-9,
                             "identical");
                     require(std::abs(mem::cosine_similarity({1, 0}, {-1, 0}) + 1.0) < 1e-9,
                             "opposite");
                     require(mem::cosine_similarity({1, 0}, {0, 1}) == 0.0, "orthogonal");
                     require(mem::cosine_similarity({0, 0}, {1, 0}) == 0.0, "zero vector");
                     require(mem::cosine_similarity({1, 0}, {1, 0, 0}) == 0.0, "length mismatch");
                   }});

  tests.push_back({"similarity_index_search_threshold_and_type", [] {
                     mem::SimilarityIndex index(kDims);
                     require(index.upsert("a", axis_vector(kDims, 0), mem::LearningType::Gotcha,
                                          "2026-01-01T00:00:00.000Z", "2026-01-01T00:00:00.000Z")
                                 .ok(),
                             "upsert a");
                     require(index.upsert("b", axis_vector(kDims, 0, 1, 0.2F),
                                          mem::LearningType::Pattern, "2026-01-02T00:00:00.000Z",
                                          "2026-01-02T00:00:00.000Z")
                                 .ok(),
                             "upsert b");
                     require(index.upsert("c", axis_vector(kDims, 3), mem::LearningType::Gotcha,
                                          "2026-01-03T00:00:00.000Z", "2026-01-03T00:00:00.000Z")
                                 .ok(),
                             "upsert c");
                     require(!index.upsert("bad", std::vector<float>(2, 1.0F),
                                           mem::LearningType::Gotcha, "", "")
                                  .ok(),
                             "dimension mismatch rejected");

                     auto hits = index.search(axis_vector(kDims, 0), 10, -1.0);
                     require(hits.ok(), hits.error());
                     require(hits.value().size() == 3, "all entries returned");
                     require(hits.value()[0].id == "a" && hits.value()[1].id == "b",
                             "best first");

                     auto above = index.search(axis_vector(kDims, 0), 10, 0.5);
                     require(above.ok() && above.value().size() == 2, "threshold filters");

                     auto typed = index.search(axis_vector(kDims, 0), 10, 0.5,
                                               mem::LearningType::Pattern);
                     require(typed.ok() && typed.value().size() == 1 &&
                                 typed.value()[0].id == "b",
                             "type filter");

                     require(index.remove("a") && !index.remove("a"), "remove once");
                     require(index.size() == 2 && !index.contains("a"), "size after remove");
                     require(index.search(axis_vector(kDims, 0), 0, -1.0).value().empty(),
                             "k = 0 returns nothing");
                   }});

  tests.push_back({"similarity_index_ties_prefer_newer", [] {
                     mem::SimilarityIndex index(kDims);
                     (void)index.upsert("old", axis_vector(kDims, 0), mem::LearningType::Pattern,
                                        "2026-01-01T00:00:00.000Z", "2026-01-01T00:00:00.000Z");
                     (void)index.upsert("new", axis_vector(kDims, 0), mem::LearningType::Pattern,
                                        "2026-02-01T00:00:00.000Z", "2026-02-01T00:00:00.000Z");
                     auto hits = index.search(axis_vector(kDims, 0), 1, 0.0);
                     require(hits.ok() && hits.value().size() == 1, "one hit");
                     require(hits.value()[0].id == "new", "newer record wins a tie");
                   }});

  tests.push_back({"similarity_index_snapshot_roundtrip", [] {
                     TempWorkspace workspace;
                     auto store = open_store(workspace.path());
                     mem::SimilarityIndex index(kDims);
                     for (std::size_t i = 0; i < 4; ++i) {
                       auto created = store->create(
                           make_draft(mem::LearningType::Pattern, "p" + std::to_string(i)),
                           axis_vector(kDims, i));
                       require(created.ok(), created.error());
                       require(index.upsert(created.value()).ok(), "upsert");
                     }
                     const auto snapshot = workspace.path() / "learnings.index";
                     require(index.save(snapshot).ok(), "save snapshot");

                     auto versions = store->active_versions();
                     require(versions.ok(), versions.error());
                     mem::SimilarityIndex loaded(kDims);
                     auto status = loaded.load(snapshot, versions.value());
                     require(status.ok(), status.error());
                     require(loaded.size() == 4, "all entries loaded");
                     auto hits = loaded.search(axis_vector(kDims, 2), 1, 0.9);
                     require(hits.ok() && hits.value().size() == 1, "search after load");
                   }});

  tests.push_back({"similarity_index_rejects_stale_or_corrupt_snapshot", [] {
                     TempWorkspace workspace;
                     auto store = open_store(workspace.path());
                     mem::SimilarityIndex index(kDims);
                     auto first = store->create(make_draft(mem::LearningType::Pattern, "first"),
                                                axis_vector(kDims, 0));
                     require(first.ok(), first.error());
                     require(index.upsert(first.value()).ok(), "upsert");
                     const auto snapshot = workspace.path() / "learnings.index";
                     require(index.save(snapshot).ok(), "save");

                     auto second = store->create(make_draft(mem::LearningType::Pattern, "second"),
                                                 axis_vector(kDims, 1));
                     require(second.ok(), second.error());

                     mem::SimilarityIndex stale(kDims);
                     auto status = stale.load(snapshot, store->active_versions().value());
                     require(status.code() == common::ErrorCode::StoreIo,
                             "snapshot missing a record is stale");
                     require(stale.size() == 0, "failed load leaves index untouched");

                     std::unordered_map<std::string, std::string> first_only;
                     first_only[first.value().id] = first.value().updated_at;
                     mem::SimilarityIndex wrong_dims(kDims * 2);
                     require(!wrong_dims.load(snapshot, first_only).ok(),
                             "dimension mismatch rejected");

                     {
                       std::ofstream out(snapshot, std::ios::binary | std::ios::trunc);
                       out << "RCIXgarbage";
                     }
                     mem::SimilarityIndex corrupt(kDims);
                     require(corrupt.load(snapshot, {}).code() == common::ErrorCode::StoreIo,
                             "corrupt snapshot rejected");

                     mem::SimilarityIndex absent(kDims);
                     require(absent.load(workspace.path() / "nope.index", {}).code() ==
                                 common::ErrorCode::NotFound,
                             "missing snapshot is not found");

                     mem::SimilarityIndex rebuilt(kDims);
                     auto count = rebuilt.rebuild(*store);
                     require(count.ok() && count.value() == 2, "rebuild from store");
                   }});
}
