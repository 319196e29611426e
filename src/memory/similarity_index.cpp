#include "recollect/memory/similarity_index.hpp"

#include "recollect/common/fs.hpp"
#include "recollect/memory/record_store.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <fstream>
#include <iterator>
#include <mutex>

namespace recollect::memory {

namespace {

constexpr char kSnapshotMagic[4] = {'R', 'C', 'I', 'X'};
constexpr std::uint32_t kSnapshotVersion = 2;

double vector_norm(const std::vector<float> &values) {
  double sum = 0.0;
  for (const float v : values) {
    sum += static_cast<double>(v) * static_cast<double>(v);
  }
  return std::sqrt(sum);
}

double dot_product(const std::vector<float> &a, const std::vector<float> &b) {
  double dot = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  }
  return dot;
}

template <typename T> void append_pod(std::string &out, const T &value) {
  out.append(reinterpret_cast<const char *>(&value), sizeof(T));
}

void append_string(std::string &out, const std::string &value) {
  append_pod(out, static_cast<std::uint64_t>(value.size()));
  out.append(value);
}

class SnapshotReader {
public:
  explicit SnapshotReader(const std::string &data) : data_(data) {}

  template <typename T> bool read(T &out) {
    if (pos_ + sizeof(T) > data_.size()) {
      return false;
    }
    std::memcpy(&out, data_.data() + pos_, sizeof(T));
    pos_ += sizeof(T);
    return true;
  }

  bool read_string(std::string &out) {
    std::uint64_t size = 0;
    if (!read(size) || size > data_.size() - pos_) {
      return false;
    }
    out.assign(data_, pos_, static_cast<std::size_t>(size));
    pos_ += static_cast<std::size_t>(size);
    return true;
  }

  bool read_floats(std::vector<float> &out, const std::size_t count) {
    const std::size_t bytes = count * sizeof(float);
    if (pos_ + bytes > data_.size()) {
      return false;
    }
    out.resize(count);
    std::memcpy(out.data(), data_.data() + pos_, bytes);
    pos_ += bytes;
    return true;
  }

  [[nodiscard]] bool at_end() const { return pos_ == data_.size(); }

private:
  const std::string &data_;
  std::size_t pos_ = 0;
};

} // namespace

double cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.empty() || b.empty() || a.size() != b.size()) {
    return 0.0;
  }
  const double norm_a = vector_norm(a);
  const double norm_b = vector_norm(b);
  if (norm_a < 1e-9 || norm_b < 1e-9) {
    return 0.0;
  }
  return std::clamp(dot_product(a, b) / (norm_a * norm_b), -1.0, 1.0);
}

SimilarityIndex::SimilarityIndex(const std::size_t dimensions) : dimensions_(dimensions) {}

SimilarityIndex::Entry SimilarityIndex::make_entry(const std::vector<float> &embedding,
                                                   const LearningType type,
                                                   const std::string &created_at,
                                                   const std::string &updated_at) {
  return Entry{.values = embedding,
               .norm = vector_norm(embedding),
               .type = type,
               .created_at = created_at,
               .updated_at = updated_at};
}

common::Status SimilarityIndex::upsert(const LearningRecord &record) {
  return upsert(record.id, record.embedding, record.type, record.created_at, record.updated_at);
}

common::Status SimilarityIndex::upsert(const std::string &id, const std::vector<float> &embedding,
                                       const LearningType type, const std::string &created_at,
                                       const std::string &updated_at) {
  if (embedding.size() != dimensions_) {
    return common::Status::error(common::ErrorCode::Validation,
                                 "embedding dimensions mismatch");
  }
  // Build the entry before taking the lock so readers wait only for the swap.
  Entry entry = make_entry(embedding, type, created_at, updated_at);
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (rebuilding_) {
    journal_.push_back(JournalOp{.id = id, .entry = entry});
  }
  entries_[id] = std::move(entry);
  return common::Status::success();
}

bool SimilarityIndex::remove(const std::string &id) {
  std::unique_lock<std::shared_mutex> lock(mutex_);
  if (rebuilding_) {
    journal_.push_back(JournalOp{.id = id, .entry = std::nullopt});
  }
  return entries_.erase(id) > 0;
}

common::Result<std::vector<IndexHit>>
SimilarityIndex::search(const std::vector<float> &query, const std::size_t k,
                        const double min_score, std::optional<LearningType> type_filter) const {
  using R = common::Result<std::vector<IndexHit>>;
  if (query.size() != dimensions_) {
    return R::failure(common::ErrorCode::Validation, "query dimensions mismatch");
  }
  if (k == 0) {
    return R::success({});
  }
  const double query_norm = vector_norm(query);
  if (query_norm < 1e-9) {
    return R::success({});
  }

  struct Scored {
    const std::string *id;
    const std::string *created_at;
    double score;
  };

  std::shared_lock<std::shared_mutex> lock(mutex_);
  std::vector<Scored> scored;
  scored.reserve(entries_.size());
  for (const auto &[id, entry] : entries_) {
    if (type_filter.has_value() && entry.type != *type_filter) {
      continue;
    }
    if (entry.norm < 1e-9) {
      continue;
    }
    const double score =
        std::clamp(dot_product(query, entry.values) / (query_norm * entry.norm), -1.0, 1.0);
    if (score < min_score) {
      continue;
    }
    scored.push_back(Scored{.id = &id, .created_at = &entry.created_at, .score = score});
  }

  const auto better = [](const Scored &lhs, const Scored &rhs) {
    if (lhs.score != rhs.score) {
      return lhs.score > rhs.score;
    }
    if (*lhs.created_at != *rhs.created_at) {
      return *lhs.created_at > *rhs.created_at;
    }
    return *lhs.id < *rhs.id;
  };
  const std::size_t keep = std::min(k, scored.size());
  std::partial_sort(scored.begin(), scored.begin() + static_cast<std::ptrdiff_t>(keep),
                    scored.end(), better);

  std::vector<IndexHit> hits;
  hits.reserve(keep);
  for (std::size_t i = 0; i < keep; ++i) {
    hits.push_back(IndexHit{.id = *scored[i].id, .score = scored[i].score});
  }
  return R::success(std::move(hits));
}

common::Result<std::size_t> SimilarityIndex::rebuild(RecordStore &store) {
  using R = common::Result<std::size_t>;
  std::lock_guard<std::mutex> rebuild_lock(rebuild_mutex_);
  {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    rebuilding_ = true;
    journal_.clear();
  }
  const auto stop_journal = [this] {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    rebuilding_ = false;
    journal_.clear();
  };

  std::unordered_map<std::string, Entry> rebuilt;
  bool dimension_error = false;
  auto status = store.for_each_active([&](const LearningRecord &record) {
    if (record.embedding.size() != dimensions_) {
      dimension_error = true;
      return;
    }
    rebuilt[record.id] =
        make_entry(record.embedding, record.type, record.created_at, record.updated_at);
  });
  if (!status.ok()) {
    stop_journal();
    return R::failure(status);
  }
  if (dimension_error) {
    stop_journal();
    return R::failure(common::ErrorCode::StoreIo,
                      "record store holds embeddings of unexpected dimensionality");
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  // Writes since the scan started committed to the store before reaching
  // the index, so the journal is never older than what the scan saw.
  for (auto &op : journal_) {
    if (op.entry.has_value()) {
      rebuilt[op.id] = std::move(*op.entry);
    } else {
      rebuilt.erase(op.id);
    }
  }
  journal_.clear();
  rebuilding_ = false;
  entries_.swap(rebuilt);
  return R::success(entries_.size());
}

common::Status SimilarityIndex::save(const std::filesystem::path &path) const {
  std::string payload;
  {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    payload.reserve(32 + entries_.size() * (64 + dimensions_ * sizeof(float)));
    payload.append(kSnapshotMagic, sizeof(kSnapshotMagic));
    append_pod(payload, kSnapshotVersion);
    append_pod(payload, static_cast<std::uint64_t>(dimensions_));
    append_pod(payload, static_cast<std::uint64_t>(entries_.size()));
    for (const auto &[id, entry] : entries_) {
      append_string(payload, id);
      append_pod(payload, static_cast<std::uint8_t>(entry.type));
      append_string(payload, entry.created_at);
      append_string(payload, entry.updated_at);
      payload.append(reinterpret_cast<const char *>(entry.values.data()),
                     entry.values.size() * sizeof(float));
    }
  }
  return common::write_file_atomic(path, payload);
}

common::Status
SimilarityIndex::load(const std::filesystem::path &path,
                      const std::unordered_map<std::string, std::string> &active_versions) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return common::Status::error(common::ErrorCode::NotFound,
                                 "no index snapshot at " + path.string());
  }
  const std::string data((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    return common::Status::error(common::ErrorCode::StoreIo, "failed to read index snapshot");
  }

  SnapshotReader reader(data);
  char magic[4] = {};
  std::uint32_t version = 0;
  std::uint64_t dims = 0;
  std::uint64_t count = 0;
  if (!reader.read(magic) || std::memcmp(magic, kSnapshotMagic, sizeof(magic)) != 0 ||
      !reader.read(version) || version != kSnapshotVersion || !reader.read(dims) ||
      !reader.read(count)) {
    return common::Status::error(common::ErrorCode::StoreIo, "index snapshot header is invalid");
  }
  if (dims != dimensions_) {
    return common::Status::error(common::ErrorCode::StoreIo,
                                 "index snapshot dimensions mismatch");
  }
  if (count != active_versions.size()) {
    return common::Status::error(common::ErrorCode::StoreIo,
                                 "index snapshot has " + std::to_string(count) +
                                     " entries, store has " +
                                     std::to_string(active_versions.size()));
  }

  std::unordered_map<std::string, Entry> loaded;
  loaded.reserve(static_cast<std::size_t>(count));
  for (std::uint64_t i = 0; i < count; ++i) {
    std::string id;
    std::uint8_t type_raw = 0;
    std::string created_at;
    std::string updated_at;
    std::vector<float> values;
    if (!reader.read_string(id) || !reader.read(type_raw) || !reader.read_string(created_at) ||
        !reader.read_string(updated_at) || !reader.read_floats(values, dimensions_)) {
      return common::Status::error(common::ErrorCode::StoreIo, "index snapshot is truncated");
    }
    if (type_raw >= kAllLearningTypes.size()) {
      return common::Status::error(common::ErrorCode::StoreIo,
                                   "index snapshot has an unknown learning type");
    }
    const auto version = active_versions.find(id);
    if (version == active_versions.end() || version->second != updated_at) {
      return common::Status::error(common::ErrorCode::StoreIo,
                                   "index snapshot is stale for " + id);
    }
    loaded[std::move(id)] =
        make_entry(values, kAllLearningTypes[type_raw], created_at, updated_at);
  }
  if (!reader.at_end() || loaded.size() != count) {
    return common::Status::error(common::ErrorCode::StoreIo, "index snapshot is malformed");
  }

  std::unique_lock<std::shared_mutex> lock(mutex_);
  entries_.swap(loaded);
  return common::Status::success();
}

std::size_t SimilarityIndex::size() const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.size();
}

bool SimilarityIndex::contains(const std::string &id) const {
  std::shared_lock<std::shared_mutex> lock(mutex_);
  return entries_.contains(id);
}

} // namespace recollect::memory
