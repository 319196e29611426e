#include "recollect/runtime/app.hpp"

#include "recollect/common/fs.hpp"
#include "recollect/config/config.hpp"
#include "recollect/health/health.hpp"
#include "recollect/observability/global.hpp"

#include <iostream>

namespace recollect::runtime {

MemoryRuntime::MemoryRuntime(config::Config config)
    : config_(std::move(config)), data_dir_(config::data_dir(config_)) {}

MemoryRuntime::MemoryRuntime(config::Config config, std::unique_ptr<memory::IEmbedder> embedder)
    : config_(std::move(config)), data_dir_(config::data_dir(config_)),
      embedder_(std::move(embedder)) {}

MemoryRuntime::~MemoryRuntime() { close(); }

common::Status MemoryRuntime::open() {
  if (open_) {
    return common::Status::success();
  }
  health::mark_component_starting("store");
  health::mark_component_starting("index");

  if (auto dir = common::ensure_dir(data_dir_); !dir.ok()) {
    health::mark_component_error("store", dir.error());
    return dir.status();
  }

  if (embedder_ == nullptr) {
    auto created = memory::create_embedder(config_, database_path());
    if (!created.ok()) {
      health::mark_component_error("embedder", created.error());
      return created.status();
    }
    embedder_ = std::move(created.value());
  }
  health::mark_component_ok("embedder");

  const std::size_t dimensions = embedder_->dimensions();
  store_ = std::make_unique<memory::RecordStore>(database_path(),
                                                 config_.store.admission_threshold);
  if (auto status = store_->open(dimensions); !status.ok()) {
    health::mark_component_error("store", status.error());
    store_.reset();
    return status;
  }
  health::mark_component_ok("store");

  index_ = std::make_unique<memory::SimilarityIndex>(dimensions);
  if (auto status = load_or_rebuild_index(); !status.ok()) {
    health::mark_component_error("index", status.error());
    store_->close();
    store_.reset();
    index_.reset();
    return status;
  }
  health::mark_component_ok("index");

  merge_ = std::make_unique<memory::MergeEngine>(*store_, *index_, *embedder_,
                                                 memory::MergeOptions::from_config(config_));
  query_ = std::make_unique<memory::QueryEngine>(*store_, *index_, *embedder_,
                                                 memory::QueryOptions::from_config(config_));
  open_ = true;
  return common::Status::success();
}

common::Status MemoryRuntime::load_or_rebuild_index() {
  auto versions = store_->active_versions();
  if (!versions.ok()) {
    return versions.status();
  }

  const auto loaded = index_->load(index_path(), versions.value());
  if (loaded.ok()) {
    std::cerr << "[daemon] loaded index snapshot (" << index_->size() << " entries)\n";
    return common::Status::success();
  }
  if (loaded.code() != common::ErrorCode::NotFound) {
    std::cerr << "[daemon] discarding index snapshot: " << loaded.error() << "\n";
  }

  auto rebuilt = index_->rebuild(*store_);
  if (!rebuilt.ok()) {
    return rebuilt.status();
  }
  std::cerr << "[daemon] rebuilt index from store (" << rebuilt.value() << " entries)\n";
  return common::Status::success();
}

void MemoryRuntime::close() {
  if (!open_.exchange(false)) {
    return;
  }
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  if (auto status = index_->save(index_path()); !status.ok()) {
    observability::record_error("index", "final snapshot failed: " + status.error());
    std::cerr << "[daemon] final index snapshot failed: " << status.error() << "\n";
  }
  query_.reset();
  merge_.reset();
  store_->close();
}

common::Status MemoryRuntime::require_open() const {
  if (!open_) {
    return common::Status::error(common::ErrorCode::StoreIo, "memory runtime is not open");
  }
  return common::Status::success();
}

void MemoryRuntime::track_store_status(const common::Status &status, const bool write) {
  if (status.code() == common::ErrorCode::StoreIo) {
    const auto failures = health::record_component_failure(
        "store", status.error(), config_.store.unhealthy_after_failures);
    observability::record_error("store", status.error() + " (consecutive failures: " +
                                             std::to_string(failures) + ")");
    return;
  }
  if (write && status.ok()) {
    health::record_component_success("store");
  }
}

common::Result<memory::StoreOutcome> MemoryRuntime::store(const memory::LearningDraft &draft) {
  if (auto status = require_open(); !status.ok()) {
    return common::Result<memory::StoreOutcome>::failure(status);
  }
  auto outcome = merge_->store(draft);
  track_store_status(outcome.status(), true);
  return outcome;
}

std::vector<common::Result<memory::StoreOutcome>>
MemoryRuntime::store_batch(const std::vector<memory::LearningDraft> &drafts) {
  if (auto status = require_open(); !status.ok()) {
    return std::vector<common::Result<memory::StoreOutcome>>(
        drafts.size(), common::Result<memory::StoreOutcome>::failure(status));
  }
  auto outcomes = merge_->store_batch(drafts);
  for (const auto &outcome : outcomes) {
    track_store_status(outcome.status(), true);
  }
  return outcomes;
}

common::Result<memory::QueryResponse> MemoryRuntime::query(const memory::QueryRequest &request) {
  if (auto status = require_open(); !status.ok()) {
    return common::Result<memory::QueryResponse>::failure(status);
  }
  auto response = query_->query(request);
  track_store_status(response.status(), false);
  return response;
}

common::Result<memory::LearningRecord> MemoryRuntime::get(const std::string &id) {
  if (auto status = require_open(); !status.ok()) {
    return common::Result<memory::LearningRecord>::failure(status);
  }
  auto record = store_->get(id);
  track_store_status(record.status(), false);
  return record;
}

common::Result<memory::RecordPage> MemoryRuntime::list(const memory::RecordFilter &filter,
                                                       const std::size_t limit,
                                                       const std::optional<std::string> &cursor) {
  if (auto status = require_open(); !status.ok()) {
    return common::Result<memory::RecordPage>::failure(status);
  }
  auto page = store_->list_page(filter, limit, cursor);
  track_store_status(page.status(), false);
  return page;
}

common::Result<bool> MemoryRuntime::forget(const std::string &id) {
  if (auto status = require_open(); !status.ok()) {
    return common::Result<bool>::failure(status);
  }
  auto removed = merge_->forget(id);
  track_store_status(removed.status(), true);
  return removed;
}

common::Result<std::size_t> MemoryRuntime::purge() {
  if (auto status = require_open(); !status.ok()) {
    return common::Result<std::size_t>::failure(status);
  }
  auto purged = store_->purge();
  track_store_status(purged.status(), true);
  return purged;
}

common::Result<std::size_t> MemoryRuntime::reindex() {
  if (auto status = require_open(); !status.ok()) {
    return common::Result<std::size_t>::failure(status);
  }
  auto rebuilt = index_->rebuild(*store_);
  track_store_status(rebuilt.status(), false);
  if (rebuilt.ok()) {
    health::mark_component_ok("index");
  }
  return rebuilt;
}

common::Result<memory::StoreStats> MemoryRuntime::stats() {
  if (auto status = require_open(); !status.ok()) {
    return common::Result<memory::StoreStats>::failure(status);
  }
  auto stats = store_->stats();
  track_store_status(stats.status(), false);
  if (stats.ok()) {
    observability::record_metric(observability::RecordCountMetric{
        .active = stats.value().total, .indexed = index_->size()});
  }
  return stats;
}

common::Status MemoryRuntime::save_snapshot() {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  if (auto status = require_open(); !status.ok()) {
    return status;
  }
  auto status = index_->save(index_path());
  if (!status.ok()) {
    observability::record_error("index", "snapshot failed: " + status.error());
  }
  return status;
}

std::size_t MemoryRuntime::indexed() const { return index_ == nullptr ? 0 : index_->size(); }

std::string MemoryRuntime::embedder_name() const {
  return embedder_ == nullptr ? "" : std::string(embedder_->name());
}

bool MemoryRuntime::healthy() const {
  if (!open_) {
    return false;
  }
  const auto store = health::get_component("store");
  return !store.has_value() || store->status != "error";
}

} // namespace recollect::runtime
