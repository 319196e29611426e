#include "recollect/memory/merge_engine.hpp"

#include "recollect/common/fs.hpp"
#include "recollect/observability/global.hpp"

namespace recollect::memory {

namespace {

constexpr std::size_t kLaneSweepThreshold = 1024;

common::Status lane_conflict(const std::string &what) {
  return common::Status::error(common::ErrorCode::ConcurrencyConflict,
                               "timed out waiting for the " + what + " lane");
}

} // namespace

MergeOptions MergeOptions::from_config(const config::Config &config) {
  return MergeOptions{
      .similarity_threshold = config.dedup.similarity_threshold,
      .merge_context = config.dedup.merge_context,
      .refresh_session_source = config.dedup.refresh_session_source,
      .include_context = config.embedding.include_context,
      .lock_timeout = std::chrono::milliseconds(config.dedup.lock_timeout_ms),
  };
}

RecordPatch merge_patch(const LearningRecord &existing, const LearningDraft &candidate,
                        const std::vector<float> &candidate_embedding,
                        const MergeOptions &options) {
  RecordPatch patch;
  if (candidate.content.size() > existing.content.size()) {
    patch.content = candidate.content;
    patch.embedding = candidate_embedding;
  }

  const std::string incoming = common::trim(candidate.context);
  if (options.merge_context && !incoming.empty() &&
      existing.context.find(incoming) == std::string::npos) {
    patch.context = existing.context.empty() ? incoming : existing.context + " | " + incoming;
  }

  if (candidate.confidence > existing.confidence) {
    patch.confidence = candidate.confidence;
  }
  patch.merge_count = existing.merge_count + 1;

  if (options.refresh_session_source && !candidate.session_source.empty()) {
    patch.session_source = candidate.session_source;
  }
  return patch;
}

MergeEngine::MergeEngine(RecordStore &store, SimilarityIndex &index, IEmbedder &embedder,
                         MergeOptions options)
    : store_(store), index_(index), embedder_(embedder), options_(options) {}

std::timed_mutex &MergeEngine::type_lane(const LearningType type) {
  return type_lanes_[static_cast<std::size_t>(type)];
}

std::shared_ptr<std::timed_mutex> MergeEngine::record_lane(const std::string &id) {
  std::lock_guard<std::mutex> lock(record_lanes_mutex_);
  auto it = record_lanes_.find(id);
  if (it != record_lanes_.end()) {
    if (auto existing = it->second.lock()) {
      return existing;
    }
    record_lanes_.erase(it);
  }
  if (record_lanes_.size() >= kLaneSweepThreshold) {
    std::erase_if(record_lanes_, [](const auto &entry) { return entry.second.expired(); });
  }
  auto created = std::make_shared<std::timed_mutex>();
  record_lanes_[id] = created;
  return created;
}

common::Result<std::vector<float>> MergeEngine::embed_draft(const LearningDraft &draft) {
  auto embedding =
      embedder_.embed(embedding_text(draft.content, draft.context, options_.include_context));
  if (!embedding.ok()) {
    observability::record_embedding_failure(std::string(embedder_.name()), embedding.error(),
                                            embedding.code() ==
                                                common::ErrorCode::EmbeddingTimeout);
  }
  return embedding;
}

common::Result<StoreOutcome> MergeEngine::store(const LearningDraft &draft) {
  using R = common::Result<StoreOutcome>;
  if (auto status = validate_draft(draft, store_.admission_threshold()); !status.ok()) {
    return R::failure(status);
  }
  auto embedding = embed_draft(draft);
  if (!embedding.ok()) {
    return R::failure(embedding.status());
  }
  return store_embedded(draft, embedding.value());
}

std::vector<common::Result<StoreOutcome>>
MergeEngine::store_batch(const std::vector<LearningDraft> &drafts) {
  using R = common::Result<StoreOutcome>;
  std::vector<std::optional<R>> results(drafts.size());
  std::vector<std::size_t> valid;
  std::vector<std::string> texts;
  for (std::size_t i = 0; i < drafts.size(); ++i) {
    if (auto status = validate_draft(drafts[i], store_.admission_threshold()); !status.ok()) {
      results[i] = R::failure(status);
      continue;
    }
    valid.push_back(i);
    texts.push_back(
        embedding_text(drafts[i].content, drafts[i].context, options_.include_context));
  }

  if (!valid.empty()) {
    auto embeddings = embedder_.embed_batch(texts);
    if (!embeddings.ok()) {
      observability::record_embedding_failure(std::string(embedder_.name()), embeddings.error(),
                                              embeddings.code() ==
                                                  common::ErrorCode::EmbeddingTimeout);
      for (const std::size_t i : valid) {
        results[i] = R::failure(embeddings.status());
      }
    } else if (embeddings.value().size() != valid.size()) {
      for (const std::size_t i : valid) {
        results[i] = R::failure(common::ErrorCode::EmbeddingUnavailable,
                                "embedding provider returned a short batch");
      }
    } else {
      // Sequential so duplicates inside one batch merge with each other.
      for (std::size_t j = 0; j < valid.size(); ++j) {
        results[valid[j]] = store_embedded(drafts[valid[j]], embeddings.value()[j]);
      }
    }
  }

  std::vector<R> out;
  out.reserve(results.size());
  for (auto &result : results) {
    out.push_back(std::move(*result));
  }
  return out;
}

common::Result<StoreOutcome> MergeEngine::store_embedded(const LearningDraft &draft,
                                                         const std::vector<float> &embedding) {
  using R = common::Result<StoreOutcome>;
  std::unique_lock<std::timed_mutex> type_lock(type_lane(draft.type), std::defer_lock);
  if (!type_lock.try_lock_for(options_.lock_timeout)) {
    return R::failure(lane_conflict(type_to_string(draft.type) + " dedup"));
  }

  auto hits = index_.search(embedding, 1, options_.similarity_threshold, draft.type);
  if (!hits.ok()) {
    return R::failure(hits.status());
  }
  if (hits.value().empty()) {
    return create_fresh(draft, embedding);
  }

  const IndexHit match = hits.value().front();
  const auto lane = record_lane(match.id);
  std::unique_lock<std::timed_mutex> record_lock(*lane, std::defer_lock);
  if (!record_lock.try_lock_for(options_.lock_timeout)) {
    return R::failure(lane_conflict("record " + match.id));
  }

  auto existing = store_.get(match.id);
  if (!existing.ok() && existing.code() != common::ErrorCode::NotFound) {
    return R::failure(existing.status());
  }
  if (!existing.ok() || existing.value().archived) {
    // Forgotten between search and lock; the index entry is stale.
    index_.remove(match.id);
    return create_fresh(draft, embedding);
  }

  const RecordPatch patch = merge_patch(existing.value(), draft, embedding, options_);
  auto updated = store_.update(match.id, patch);
  if (!updated.ok()) {
    return R::failure(updated.status());
  }
  if (auto status = index_.upsert(updated.value()); !status.ok()) {
    return R::failure(status);
  }

  observability::record_learning_stored(match.id, type_to_string(draft.type), false, match.score);
  return R::success(StoreOutcome{.id = match.id,
                                 .created = false,
                                 .similarity = match.score,
                                 .merge_count = updated.value().merge_count});
}

common::Result<StoreOutcome> MergeEngine::create_fresh(const LearningDraft &draft,
                                                       const std::vector<float> &embedding) {
  using R = common::Result<StoreOutcome>;
  auto created = store_.create(draft, embedding);
  if (!created.ok()) {
    return R::failure(created.status());
  }
  if (auto status = index_.upsert(created.value()); !status.ok()) {
    return R::failure(status);
  }

  observability::record_learning_stored(created.value().id, type_to_string(draft.type), true,
                                        std::nullopt);
  return R::success(StoreOutcome{.id = created.value().id,
                                 .created = true,
                                 .similarity = std::nullopt,
                                 .merge_count = created.value().merge_count});
}

common::Result<bool> MergeEngine::forget(const std::string &id) {
  using R = common::Result<bool>;
  const auto lane = record_lane(id);
  std::unique_lock<std::timed_mutex> record_lock(*lane, std::defer_lock);
  if (!record_lock.try_lock_for(options_.lock_timeout)) {
    return R::failure(lane_conflict("record " + id));
  }

  auto removed = store_.remove(id);
  if (!removed.ok()) {
    return removed;
  }
  index_.remove(id);
  return removed;
}

} // namespace recollect::memory
