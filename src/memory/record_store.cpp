#include "recollect/memory/record_store.hpp"

#include "recollect/common/fs.hpp"
#include "recollect/memory/sqlite_util.hpp"

#include <charconv>
#include <cmath>

namespace recollect::memory {

namespace {

constexpr const char *kRecordColumns =
    "seq, id, type, content, context, confidence, embedding, session_source, created_at, "
    "updated_at, merge_count, archived";

struct ListKey {
  std::string created_at;
  std::int64_t seq = 0;
};

std::string encode_cursor(const ListKey &key) {
  return key.created_at + "|" + std::to_string(key.seq);
}

std::optional<ListKey> decode_cursor(const std::string &token) {
  const auto bar = token.rfind('|');
  if (bar == std::string::npos || bar == 0 || bar + 1 >= token.size()) {
    return std::nullopt;
  }
  ListKey key;
  key.created_at = token.substr(0, bar);
  const char *first = token.data() + bar + 1;
  const char *last = token.data() + token.size();
  auto [ptr, ec] = std::from_chars(first, last, key.seq);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return key;
}

LearningRecord row_to_record(sqlite3_stmt *stmt) {
  LearningRecord record;
  record.id = column_text(stmt, 1);
  record.type = type_from_string(column_text(stmt, 2)).value_or(LearningType::Pattern);
  record.content = column_text(stmt, 3);
  record.context = column_text(stmt, 4);
  record.confidence = sqlite3_column_double(stmt, 5);
  record.embedding = blob_to_vector(sqlite3_column_blob(stmt, 6), sqlite3_column_bytes(stmt, 6));
  record.session_source = column_text(stmt, 7);
  record.created_at = column_text(stmt, 8);
  record.updated_at = column_text(stmt, 9);
  record.merge_count = static_cast<std::uint32_t>(sqlite3_column_int64(stmt, 10));
  record.archived = sqlite3_column_int(stmt, 11) != 0;
  return record;
}

common::Status not_open() {
  return common::Status::error(common::ErrorCode::StoreIo, "record store is not open");
}

} // namespace

RecordCursor::RecordCursor(RecordStore &store, RecordFilter filter, const std::size_t page_size)
    : store_(&store), filter_(std::move(filter)), page_size_(page_size == 0 ? 1 : page_size) {}

common::Result<std::optional<LearningRecord>> RecordCursor::next() {
  using R = common::Result<std::optional<LearningRecord>>;
  if (position_ >= buffer_.size()) {
    if (exhausted_) {
      return R::success(std::nullopt);
    }
    auto page = store_->list_page(filter_, page_size_, after_);
    if (!page.ok()) {
      return R::failure(page.status());
    }
    buffer_ = std::move(page.value().records);
    position_ = 0;
    after_ = page.value().next_cursor;
    exhausted_ = !after_.has_value();
    if (buffer_.empty()) {
      return R::success(std::nullopt);
    }
  }
  return R::success(std::move(buffer_[position_++]));
}

void RecordCursor::reset() {
  buffer_.clear();
  position_ = 0;
  after_.reset();
  exhausted_ = false;
}

RecordStore::RecordStore(std::filesystem::path db_path, const double admission_threshold)
    : db_path_(std::move(db_path)), admission_threshold_(admission_threshold) {}

RecordStore::~RecordStore() { close(); }

common::Status RecordStore::open(const std::size_t dimensions) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ != nullptr) {
    return common::Status::success();
  }
  if (dimensions == 0) {
    return common::Status::error(common::ErrorCode::Validation,
                                 "embedding dimensions must be positive");
  }

  auto opened = open_database(db_path_);
  if (!opened.ok()) {
    return opened.status();
  }
  db_ = opened.value();

  auto status = init_schema();
  if (status.ok()) {
    status = verify_dimensions(dimensions);
  }
  if (!status.ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
    return status;
  }
  dimensions_ = dimensions;
  return common::Status::success();
}

void RecordStore::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ != nullptr) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

bool RecordStore::is_open() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return db_ != nullptr;
}

common::Status RecordStore::init_schema() {
  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS learnings (
  seq INTEGER PRIMARY KEY AUTOINCREMENT,
  id TEXT NOT NULL UNIQUE,
  type TEXT NOT NULL,
  content TEXT NOT NULL,
  context TEXT NOT NULL DEFAULT '',
  confidence REAL NOT NULL CHECK (confidence >= 0.0 AND confidence <= 1.0),
  embedding BLOB NOT NULL,
  session_source TEXT NOT NULL DEFAULT '',
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL,
  merge_count INTEGER NOT NULL DEFAULT 1,
  archived INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS learnings_created_idx ON learnings(created_at DESC, seq DESC);
CREATE INDEX IF NOT EXISTS learnings_type_idx ON learnings(type, archived);
CREATE TABLE IF NOT EXISTS store_meta (
  key TEXT PRIMARY KEY,
  value TEXT NOT NULL
);
)");
}

common::Status RecordStore::verify_dimensions(const std::size_t dimensions) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT value FROM store_meta WHERE key = 'embedding_dimensions'",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return sqlite_error(db_, "read store metadata");
  }
  std::optional<std::string> recorded;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    recorded = column_text(stmt, 0);
  }
  sqlite3_finalize(stmt);

  const std::string wanted = std::to_string(dimensions);
  if (recorded.has_value()) {
    if (*recorded != wanted) {
      return common::Status::error(common::ErrorCode::Validation,
                                   "store holds " + *recorded +
                                       "-dimensional embeddings but the embedder produces " +
                                       wanted);
    }
    return common::Status::success();
  }

  if (sqlite3_prepare_v2(db_,
                         "INSERT INTO store_meta(key, value) VALUES('embedding_dimensions', ?1)",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return sqlite_error(db_, "write store metadata");
  }
  sqlite3_bind_text(stmt, 1, wanted.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return sqlite_error(db_, "write store metadata");
  }
  return common::Status::success();
}

common::Result<LearningRecord> RecordStore::create(const LearningDraft &draft,
                                                   const std::vector<float> &embedding) {
  using R = common::Result<LearningRecord>;
  auto valid = validate_draft(draft, admission_threshold_);
  if (!valid.ok()) {
    return R::failure(valid);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return R::failure(not_open());
  }
  if (embedding.size() != dimensions_) {
    return R::failure(common::ErrorCode::Validation,
                      "embedding has " + std::to_string(embedding.size()) +
                          " dimensions, store expects " + std::to_string(dimensions_));
  }

  auto id = generate_learning_id();
  if (!id.ok()) {
    return R::failure(common::ErrorCode::Internal, id.error());
  }

  LearningRecord record;
  record.id = id.value();
  record.type = draft.type;
  record.content = draft.content;
  record.context = draft.context;
  record.confidence = draft.confidence;
  record.embedding = embedding;
  record.session_source = draft.session_source;
  record.created_at = now_rfc3339();
  record.updated_at = record.created_at;
  record.merge_count = 1;

  sqlite3_stmt *stmt = nullptr;
  const char *sql = R"(
INSERT INTO learnings(id, type, content, context, confidence, embedding, session_source,
                      created_at, updated_at, merge_count, archived)
VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?8, 1, 0)
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return R::failure(sqlite_error(db_, "prepare insert"));
  }

  const std::string type_value = type_to_string(record.type);
  const auto blob = vector_to_blob(record.embedding);
  sqlite3_bind_text(stmt, 1, record.id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, type_value.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, record.content.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, record.context.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_double(stmt, 5, record.confidence);
  sqlite3_bind_blob(stmt, 6, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 7, record.session_source.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 8, record.created_at.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return R::failure(sqlite_error(db_, "insert learning"));
  }
  return R::success(std::move(record));
}

common::Result<LearningRecord> RecordStore::get(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return get_locked(id);
}

common::Result<LearningRecord> RecordStore::get_locked(const std::string &id) {
  using R = common::Result<LearningRecord>;
  if (db_ == nullptr) {
    return R::failure(not_open());
  }

  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + kRecordColumns + " FROM learnings WHERE id = ?1";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return R::failure(sqlite_error(db_, "prepare get"));
  }
  sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    auto record = row_to_record(stmt);
    sqlite3_finalize(stmt);
    return R::success(std::move(record));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return R::failure(sqlite_error(db_, "read learning"));
  }
  return R::failure(common::ErrorCode::NotFound, "learning not found: " + id);
}

common::Result<LearningRecord> RecordStore::update(const std::string &id,
                                                   const RecordPatch &patch) {
  using R = common::Result<LearningRecord>;
  if (patch.content.has_value() && common::trim(*patch.content).empty()) {
    return R::failure(common::ErrorCode::Validation, "content must not be empty");
  }
  if (patch.confidence.has_value() &&
      (!std::isfinite(*patch.confidence) || *patch.confidence < 0.0 || *patch.confidence > 1.0)) {
    return R::failure(common::ErrorCode::Validation, "confidence must be between 0.0 and 1.0");
  }
  if (patch.merge_count.has_value() && *patch.merge_count == 0) {
    return R::failure(common::ErrorCode::Validation, "merge_count must be at least 1");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return R::failure(not_open());
  }
  if (patch.embedding.has_value() && patch.embedding->size() != dimensions_) {
    return R::failure(common::ErrorCode::Validation, "embedding dimensionality mismatch");
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql = R"(
UPDATE learnings SET
  content = COALESCE(?2, content),
  context = COALESCE(?3, context),
  confidence = COALESCE(?4, confidence),
  embedding = COALESCE(?5, embedding),
  merge_count = COALESCE(?6, merge_count),
  session_source = COALESCE(?7, session_source),
  updated_at = ?8
WHERE id = ?1
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return R::failure(sqlite_error(db_, "prepare update"));
  }

  std::vector<unsigned char> blob;
  sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
  if (patch.content.has_value()) {
    sqlite3_bind_text(stmt, 2, patch.content->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, 2);
  }
  if (patch.context.has_value()) {
    sqlite3_bind_text(stmt, 3, patch.context->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, 3);
  }
  if (patch.confidence.has_value()) {
    sqlite3_bind_double(stmt, 4, *patch.confidence);
  } else {
    sqlite3_bind_null(stmt, 4);
  }
  if (patch.embedding.has_value()) {
    blob = vector_to_blob(*patch.embedding);
    sqlite3_bind_blob(stmt, 5, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, 5);
  }
  if (patch.merge_count.has_value()) {
    sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(*patch.merge_count));
  } else {
    sqlite3_bind_null(stmt, 6);
  }
  if (patch.session_source.has_value()) {
    sqlite3_bind_text(stmt, 7, patch.session_source->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, 7);
  }
  const std::string now = now_rfc3339();
  sqlite3_bind_text(stmt, 8, now.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return R::failure(sqlite_error(db_, "update learning"));
  }
  if (sqlite3_changes(db_) == 0) {
    return R::failure(common::ErrorCode::NotFound, "learning not found: " + id);
  }
  return get_locked(id);
}

RecordCursor RecordStore::list(RecordFilter filter, const std::size_t page_size) {
  return RecordCursor(*this, std::move(filter), page_size);
}

common::Result<RecordPage> RecordStore::list_page(const RecordFilter &filter,
                                                  const std::size_t limit,
                                                  const std::optional<std::string> &cursor) {
  using R = common::Result<RecordPage>;
  if (limit == 0) {
    return R::failure(common::ErrorCode::Validation, "limit must be positive");
  }
  std::optional<ListKey> after;
  if (cursor.has_value() && !cursor->empty()) {
    after = decode_cursor(*cursor);
    if (!after.has_value()) {
      return R::failure(common::ErrorCode::Validation, "invalid cursor");
    }
  }

  std::string sql = std::string("SELECT ") + kRecordColumns + " FROM learnings WHERE confidence >= ?1";
  if (!filter.include_archived) {
    sql += " AND archived = 0";
  }
  if (filter.type.has_value()) {
    sql += " AND type = ?2";
  }
  if (filter.session_source.has_value()) {
    sql += " AND session_source = ?3";
  }
  if (after.has_value()) {
    sql += " AND (created_at < ?4 OR (created_at = ?4 AND seq < ?5))";
  }
  sql += " ORDER BY created_at DESC, seq DESC LIMIT ?6";

  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return R::failure(not_open());
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return R::failure(sqlite_error(db_, "prepare list"));
  }
  sqlite3_bind_double(stmt, 1, filter.min_confidence);
  std::string type_value;
  if (filter.type.has_value()) {
    type_value = type_to_string(*filter.type);
    sqlite3_bind_text(stmt, 2, type_value.c_str(), -1, SQLITE_TRANSIENT);
  }
  if (filter.session_source.has_value()) {
    sqlite3_bind_text(stmt, 3, filter.session_source->c_str(), -1, SQLITE_TRANSIENT);
  }
  if (after.has_value()) {
    sqlite3_bind_text(stmt, 4, after->created_at.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_int64(stmt, 5, after->seq);
  }
  // One extra row tells us whether another page exists.
  sqlite3_bind_int64(stmt, 6, static_cast<sqlite3_int64>(limit + 1));

  RecordPage page;
  ListKey last_key;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    if (page.records.size() == limit) {
      page.next_cursor = encode_cursor(last_key);
      break;
    }
    last_key.seq = sqlite3_column_int64(stmt, 0);
    page.records.push_back(row_to_record(stmt));
    last_key.created_at = page.records.back().created_at;
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return R::failure(sqlite_error(db_, "list learnings"));
  }
  return R::success(std::move(page));
}

common::Result<bool> RecordStore::remove(const std::string &id) {
  using R = common::Result<bool>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return R::failure(not_open());
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "UPDATE learnings SET archived = 1, updated_at = ?2 "
                         "WHERE id = ?1 AND archived = 0",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return R::failure(sqlite_error(db_, "prepare archive"));
  }
  const std::string now = now_rfc3339();
  sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, now.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return R::failure(sqlite_error(db_, "archive learning"));
  }
  return R::success(sqlite3_changes(db_) > 0);
}

common::Result<std::size_t> RecordStore::purge() {
  using R = common::Result<std::size_t>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return R::failure(not_open());
  }
  auto status = exec_sql(db_, "DELETE FROM learnings WHERE archived = 1");
  if (!status.ok()) {
    return R::failure(status);
  }
  return R::success(static_cast<std::size_t>(sqlite3_changes(db_)));
}

common::Status
RecordStore::for_each_active(const std::function<void(const LearningRecord &)> &fn) {
  auto cursor = list(RecordFilter{}, 512);
  while (true) {
    auto next = cursor.next();
    if (!next.ok()) {
      return next.status();
    }
    if (!next.value().has_value()) {
      return common::Status::success();
    }
    fn(*next.value());
  }
}

common::Result<std::unordered_map<std::string, std::string>> RecordStore::active_versions() {
  using R = common::Result<std::unordered_map<std::string, std::string>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return R::failure(not_open());
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT id, updated_at FROM learnings WHERE archived = 0", -1,
                         &stmt, nullptr) != SQLITE_OK) {
    return R::failure(sqlite_error(db_, "prepare versions"));
  }
  std::unordered_map<std::string, std::string> versions;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    versions.emplace(column_text(stmt, 0), column_text(stmt, 1));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return R::failure(sqlite_error(db_, "read versions"));
  }
  return R::success(std::move(versions));
}

common::Result<StoreStats> RecordStore::stats() {
  using R = common::Result<StoreStats>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return R::failure(not_open());
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "SELECT type, archived, COUNT(*) FROM learnings GROUP BY type, archived",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return R::failure(sqlite_error(db_, "prepare stats"));
  }

  StoreStats stats;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    const auto count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 2));
    if (sqlite3_column_int(stmt, 1) != 0) {
      stats.archived += count;
      continue;
    }
    stats.total += count;
    if (const auto type = type_from_string(column_text(stmt, 0)); type.has_value()) {
      stats.by_type[static_cast<std::size_t>(*type)] += count;
    }
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return R::failure(sqlite_error(db_, "read stats"));
  }
  return R::success(stats);
}

common::Result<std::size_t> RecordStore::count_active() {
  auto stats_result = stats();
  if (!stats_result.ok()) {
    return common::Result<std::size_t>::failure(stats_result.status());
  }
  return common::Result<std::size_t>::success(stats_result.value().total);
}

} // namespace recollect::memory
