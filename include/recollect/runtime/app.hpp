#pragma once

#include "recollect/common/result.hpp"
#include "recollect/config/schema.hpp"
#include "recollect/memory/embedder.hpp"
#include "recollect/memory/merge_engine.hpp"
#include "recollect/memory/query_engine.hpp"
#include "recollect/memory/record_store.hpp"
#include "recollect/memory/similarity_index.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace recollect::runtime {

inline constexpr const char *kDatabaseFile = "learnings.db";
inline constexpr const char *kIndexFile = "learnings.index";
inline constexpr const char *kPidFile = "recollect.pid";

/// Process-wide state of the memory service: configuration, the record
/// store, the similarity index and the engines built over them. Constructed
/// explicitly by the daemon (or a test) and passed to the gateway.
class MemoryRuntime {
public:
  explicit MemoryRuntime(config::Config config);
  /// Use a caller-provided embedder instead of the configured provider.
  MemoryRuntime(config::Config config, std::unique_ptr<memory::IEmbedder> embedder);
  ~MemoryRuntime();

  MemoryRuntime(const MemoryRuntime &) = delete;
  MemoryRuntime &operator=(const MemoryRuntime &) = delete;

  /// Build the embedder, open the store (verifying dimensionality), then
  /// load the index snapshot or rebuild the index from the store.
  [[nodiscard]] common::Status open();
  /// Write a final index snapshot and close the store.
  void close();
  [[nodiscard]] bool is_open() const { return open_.load(); }

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] const std::filesystem::path &data_dir() const { return data_dir_; }
  [[nodiscard]] std::filesystem::path database_path() const { return data_dir_ / kDatabaseFile; }
  [[nodiscard]] std::filesystem::path index_path() const { return data_dir_ / kIndexFile; }
  [[nodiscard]] std::filesystem::path pid_path() const { return data_dir_ / kPidFile; }

  [[nodiscard]] common::Result<memory::StoreOutcome> store(const memory::LearningDraft &draft);
  [[nodiscard]] std::vector<common::Result<memory::StoreOutcome>>
  store_batch(const std::vector<memory::LearningDraft> &drafts);
  [[nodiscard]] common::Result<memory::QueryResponse> query(const memory::QueryRequest &request);

  [[nodiscard]] common::Result<memory::LearningRecord> get(const std::string &id);
  [[nodiscard]] common::Result<memory::RecordPage> list(const memory::RecordFilter &filter,
                                                        std::size_t limit,
                                                        const std::optional<std::string> &cursor);
  [[nodiscard]] common::Result<bool> forget(const std::string &id);
  [[nodiscard]] common::Result<std::size_t> purge();
  [[nodiscard]] common::Result<std::size_t> reindex();
  [[nodiscard]] common::Result<memory::StoreStats> stats();

  [[nodiscard]] common::Status save_snapshot();

  [[nodiscard]] std::size_t indexed() const;
  [[nodiscard]] std::string embedder_name() const;
  /// False once the store has failed `store.unhealthy_after_failures`
  /// consecutive times without a successful write in between.
  [[nodiscard]] bool healthy() const;

private:
  [[nodiscard]] common::Status require_open() const;
  void track_store_status(const common::Status &status, bool write);
  [[nodiscard]] common::Status load_or_rebuild_index();

  config::Config config_;
  std::filesystem::path data_dir_;
  std::unique_ptr<memory::IEmbedder> embedder_;
  std::unique_ptr<memory::RecordStore> store_;
  std::unique_ptr<memory::SimilarityIndex> index_;
  std::unique_ptr<memory::MergeEngine> merge_;
  std::unique_ptr<memory::QueryEngine> query_;
  std::atomic<bool> open_{false};
  std::mutex snapshot_mutex_;
};

} // namespace recollect::runtime
