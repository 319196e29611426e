#include "recollect/memory/embedder_local.hpp"

#include <cctype>
#include <cmath>
#include <cstdint>

namespace recollect::memory {

namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ULL;
constexpr std::uint64_t kFnvPrime = 1099511628211ULL;

constexpr float kWordWeight = 1.0F;
constexpr float kTrigramWeight = 0.5F;

std::uint64_t fnv1a(const std::string_view prefix, const std::string_view text) {
  std::uint64_t hash = kFnvOffset;
  for (const char c : prefix) {
    hash ^= static_cast<unsigned char>(c);
    hash *= kFnvPrime;
  }
  for (const char c : text) {
    hash ^= static_cast<unsigned char>(c);
    hash *= kFnvPrime;
  }
  return hash;
}

void add_feature(std::vector<float> &values, const std::uint64_t hash, const float weight) {
  const std::size_t idx = static_cast<std::size_t>(hash % values.size());
  const float sign = (hash >> 63U) != 0 ? -1.0F : 1.0F;
  values[idx] += sign * weight;
}

std::vector<std::string> tokenize(const std::string_view text) {
  std::vector<std::string> tokens;
  std::string current;
  for (const char raw : text) {
    const auto c = static_cast<unsigned char>(raw);
    // Bytes >= 0x80 belong to multi-byte UTF-8 sequences; keep them in the token.
    if (std::isalnum(c) != 0 || c >= 0x80 || c == '_') {
      current.push_back(static_cast<char>(std::tolower(c)));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

void normalize(std::vector<float> &values) {
  double norm = 0.0;
  for (float v : values) {
    norm += static_cast<double>(v) * static_cast<double>(v);
  }
  norm = std::sqrt(norm);
  if (norm < 1e-9) {
    return;
  }
  for (float &v : values) {
    v = static_cast<float>(static_cast<double>(v) / norm);
  }
}

} // namespace

LocalEmbedder::LocalEmbedder(const std::size_t dimensions)
    : dimensions_(dimensions == 0 ? 384 : dimensions) {}

std::string_view LocalEmbedder::name() const { return "local"; }

common::Result<std::vector<float>> LocalEmbedder::embed(const std::string_view text) {
  std::vector<float> values(dimensions_, 0.0F);

  for (const auto &token : tokenize(text)) {
    add_feature(values, fnv1a("w:", token), kWordWeight);

    const std::string padded = " " + token + " ";
    for (std::size_t i = 0; i + 3 <= padded.size(); ++i) {
      add_feature(values, fnv1a("t:", std::string_view(padded).substr(i, 3)), kTrigramWeight);
    }
  }

  normalize(values);
  return common::Result<std::vector<float>>::success(std::move(values));
}

common::Result<std::vector<std::vector<float>>>
LocalEmbedder::embed_batch(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    auto emb = embed(text);
    if (!emb.ok()) {
      return common::Result<std::vector<std::vector<float>>>::failure(emb.status());
    }
    out.push_back(std::move(emb.value()));
  }
  return common::Result<std::vector<std::vector<float>>>::success(std::move(out));
}

std::size_t LocalEmbedder::dimensions() const { return dimensions_; }

} // namespace recollect::memory
