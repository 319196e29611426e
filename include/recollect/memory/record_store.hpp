#pragma once

#include "recollect/common/result.hpp"
#include "recollect/memory/learning.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace recollect::memory {

class RecordStore;

struct RecordPage {
  std::vector<LearningRecord> records;
  std::optional<std::string> next_cursor;
};

/// Lazy walk over a filtered listing, newest first. Pages are fetched on
/// demand with keyset pagination, so records created during the walk never
/// shift earlier positions.
class RecordCursor {
public:
  RecordCursor(RecordStore &store, RecordFilter filter, std::size_t page_size);

  /// Next record, or nullopt once the listing is exhausted.
  [[nodiscard]] common::Result<std::optional<LearningRecord>> next();

  /// Restart from the newest record.
  void reset();

private:
  RecordStore *store_;
  RecordFilter filter_;
  std::size_t page_size_;
  std::vector<LearningRecord> buffer_;
  std::size_t position_ = 0;
  std::optional<std::string> after_;
  bool exhausted_ = false;
};

/// Durable home of learning records. One SQLite connection (WAL,
/// synchronous=FULL) guarded by a mutex; every write commits before
/// returning.
class RecordStore {
public:
  RecordStore(std::filesystem::path db_path, double admission_threshold);
  ~RecordStore();

  RecordStore(const RecordStore &) = delete;
  RecordStore &operator=(const RecordStore &) = delete;

  /// Open or create the database. The first open records `dimensions`; later
  /// opens fail with a validation error when it differs.
  [[nodiscard]] common::Status open(std::size_t dimensions);
  void close();
  [[nodiscard]] bool is_open() const;

  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }
  [[nodiscard]] std::size_t dimensions() const { return dimensions_; }
  [[nodiscard]] double admission_threshold() const { return admission_threshold_; }

  [[nodiscard]] common::Result<LearningRecord> create(const LearningDraft &draft,
                                                      const std::vector<float> &embedding);
  [[nodiscard]] common::Result<LearningRecord> get(const std::string &id);
  [[nodiscard]] common::Result<LearningRecord> update(const std::string &id,
                                                      const RecordPatch &patch);

  [[nodiscard]] RecordCursor list(RecordFilter filter, std::size_t page_size = 128);
  [[nodiscard]] common::Result<RecordPage> list_page(const RecordFilter &filter,
                                                     std::size_t limit,
                                                     const std::optional<std::string> &cursor);

  /// Soft delete. False when the id is unknown or already archived.
  [[nodiscard]] common::Result<bool> remove(const std::string &id);

  /// Physically delete archived records.
  [[nodiscard]] common::Result<std::size_t> purge();

  [[nodiscard]] common::Status
  for_each_active(const std::function<void(const LearningRecord &)> &fn);

  /// id -> updated_at of every non-archived record; used to validate index snapshots.
  [[nodiscard]] common::Result<std::unordered_map<std::string, std::string>> active_versions();

  [[nodiscard]] common::Result<StoreStats> stats();
  [[nodiscard]] common::Result<std::size_t> count_active();

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status verify_dimensions(std::size_t dimensions);
  [[nodiscard]] common::Result<LearningRecord> get_locked(const std::string &id);

  std::filesystem::path db_path_;
  double admission_threshold_;
  std::size_t dimensions_ = 0;
  sqlite3 *db_ = nullptr;
  mutable std::mutex mutex_;
};

} // namespace recollect::memory
