#include "recollect/memory/embedding_cache.hpp"

#include "recollect/memory/sqlite_util.hpp"

namespace recollect::memory {

namespace {

struct Statement {
  sqlite3_stmt *stmt = nullptr;
  ~Statement() {
    if (stmt != nullptr) {
      sqlite3_finalize(stmt);
    }
  }
};

} // namespace

EmbeddingCache::EmbeddingCache(std::filesystem::path db_path, const std::size_t capacity)
    : db_path_(std::move(db_path)), capacity_(capacity == 0 ? 1 : capacity) {}

EmbeddingCache::~EmbeddingCache() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status EmbeddingCache::open() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ != nullptr) {
    return common::Status::success();
  }
  auto opened = open_database(db_path_);
  if (!opened.ok()) {
    return opened.status();
  }
  db_ = opened.value();
  auto status = exec_sql(db_, "CREATE TABLE IF NOT EXISTS embedding_cache ("
                              "hash TEXT PRIMARY KEY,"
                              "embedding BLOB NOT NULL,"
                              "last_used INTEGER NOT NULL);"
                              "CREATE INDEX IF NOT EXISTS idx_embedding_cache_used "
                              "ON embedding_cache(last_used);");
  if (!status.ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
    return status;
  }

  Statement count;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM embedding_cache;", -1, &count.stmt,
                         nullptr) == SQLITE_OK &&
      sqlite3_step(count.stmt) == SQLITE_ROW) {
    stats_.entries = static_cast<std::size_t>(sqlite3_column_int64(count.stmt, 0));
  }
  return common::Status::success();
}

common::Result<std::optional<std::vector<float>>> EmbeddingCache::get(const std::string &key) {
  using R = common::Result<std::optional<std::vector<float>>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return R::failure(common::ErrorCode::StoreIo, "embedding cache is not open");
  }

  const std::string hash = sha256_hex(key);
  Statement select;
  if (sqlite3_prepare_v2(db_, "SELECT embedding FROM embedding_cache WHERE hash = ?1;", -1,
                         &select.stmt, nullptr) != SQLITE_OK) {
    return R::failure(sqlite_error(db_, "prepare cache lookup"));
  }
  sqlite3_bind_text(select.stmt, 1, hash.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(select.stmt);
  if (rc == SQLITE_DONE) {
    ++stats_.misses;
    return R::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    return R::failure(sqlite_error(db_, "cache lookup"));
  }
  std::vector<float> values = blob_to_vector(sqlite3_column_blob(select.stmt, 0),
                                             sqlite3_column_bytes(select.stmt, 0));
  ++stats_.hits;

  Statement touch;
  if (sqlite3_prepare_v2(db_,
                         "UPDATE embedding_cache SET last_used = strftime('%s','now') "
                         "WHERE hash = ?1;",
                         -1, &touch.stmt, nullptr) == SQLITE_OK) {
    sqlite3_bind_text(touch.stmt, 1, hash.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(touch.stmt) != SQLITE_DONE) {
      return R::failure(sqlite_error(db_, "cache touch"));
    }
  }
  return R::success(std::move(values));
}

common::Status EmbeddingCache::put(const std::string &key, const std::vector<float> &embedding) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(common::ErrorCode::StoreIo, "embedding cache is not open");
  }

  const std::string hash = sha256_hex(key);
  const auto blob = vector_to_blob(embedding);
  Statement upsert;
  if (sqlite3_prepare_v2(db_,
                         "INSERT OR REPLACE INTO embedding_cache(hash, embedding, last_used) "
                         "VALUES (?1, ?2, strftime('%s','now'));",
                         -1, &upsert.stmt, nullptr) != SQLITE_OK) {
    return sqlite_error(db_, "prepare cache insert");
  }
  sqlite3_bind_text(upsert.stmt, 1, hash.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_blob(upsert.stmt, 2, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
  if (sqlite3_step(upsert.stmt) != SQLITE_DONE) {
    return sqlite_error(db_, "cache insert");
  }

  Statement trim;
  if (sqlite3_prepare_v2(db_,
                         "DELETE FROM embedding_cache WHERE hash IN ("
                         "SELECT hash FROM embedding_cache ORDER BY last_used DESC, rowid DESC "
                         "LIMIT -1 OFFSET ?1);",
                         -1, &trim.stmt, nullptr) != SQLITE_OK) {
    return sqlite_error(db_, "prepare cache trim");
  }
  sqlite3_bind_int64(trim.stmt, 1, static_cast<sqlite3_int64>(capacity_));
  if (sqlite3_step(trim.stmt) != SQLITE_DONE) {
    return sqlite_error(db_, "cache trim");
  }

  Statement count;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM embedding_cache;", -1, &count.stmt,
                         nullptr) == SQLITE_OK &&
      sqlite3_step(count.stmt) == SQLITE_ROW) {
    stats_.entries = static_cast<std::size_t>(sqlite3_column_int64(count.stmt, 0));
  }
  return common::Status::success();
}

EmbeddingCacheStats EmbeddingCache::stats() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

CachedEmbedder::CachedEmbedder(std::unique_ptr<IEmbedder> inner,
                               std::unique_ptr<EmbeddingCache> cache)
    : inner_(std::move(inner)), cache_(std::move(cache)) {}

std::string_view CachedEmbedder::name() const { return inner_->name(); }

std::string CachedEmbedder::cache_key(const std::string_view text) const {
  std::string key(inner_->name());
  key += ':';
  key += std::to_string(inner_->dimensions());
  key += ':';
  key.append(text);
  return key;
}

common::Result<std::vector<float>> CachedEmbedder::embed(const std::string_view text) {
  using R = common::Result<std::vector<float>>;
  const std::string key = cache_key(text);
  auto cached = cache_->get(key);
  if (!cached.ok()) {
    return R::failure(cached.status());
  }
  if (cached.value().has_value() && cached.value()->size() == inner_->dimensions()) {
    return R::success(std::move(*cached.value()));
  }

  auto fresh = inner_->embed(text);
  if (!fresh.ok()) {
    return fresh;
  }
  if (auto status = cache_->put(key, fresh.value()); !status.ok()) {
    return R::failure(status);
  }
  return fresh;
}

common::Result<std::vector<std::vector<float>>>
CachedEmbedder::embed_batch(const std::vector<std::string> &texts) {
  using R = common::Result<std::vector<std::vector<float>>>;
  std::vector<std::vector<float>> out(texts.size());
  std::vector<std::size_t> missing;
  for (std::size_t i = 0; i < texts.size(); ++i) {
    auto cached = cache_->get(cache_key(texts[i]));
    if (!cached.ok()) {
      return R::failure(cached.status());
    }
    if (cached.value().has_value() && cached.value()->size() == inner_->dimensions()) {
      out[i] = std::move(*cached.value());
    } else {
      missing.push_back(i);
    }
  }
  if (missing.empty()) {
    return R::success(std::move(out));
  }

  std::vector<std::string> pending;
  pending.reserve(missing.size());
  for (const std::size_t i : missing) {
    pending.push_back(texts[i]);
  }
  auto fresh = inner_->embed_batch(pending);
  if (!fresh.ok()) {
    return fresh;
  }
  if (fresh.value().size() != missing.size()) {
    return R::failure(common::ErrorCode::EmbeddingUnavailable,
                      "embedding provider returned a short batch");
  }
  for (std::size_t j = 0; j < missing.size(); ++j) {
    const std::size_t i = missing[j];
    if (auto status = cache_->put(cache_key(texts[i]), fresh.value()[j]); !status.ok()) {
      return R::failure(status);
    }
    out[i] = std::move(fresh.value()[j]);
  }
  return R::success(std::move(out));
}

std::size_t CachedEmbedder::dimensions() const { return inner_->dimensions(); }

} // namespace recollect::memory
