#pragma once

#include "recollect/memory/embedder.hpp"

namespace recollect::memory {

/// Deterministic feature-hashing embedder: lower-cased word tokens and
/// character trigrams hashed (FNV-1a, signed) into a normalized vector.
/// Stable across platforms and processes.
class LocalEmbedder final : public IEmbedder {
public:
  explicit LocalEmbedder(std::size_t dimensions = 384);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts) override;
  [[nodiscard]] std::size_t dimensions() const override;

private:
  std::size_t dimensions_;
};

} // namespace recollect::memory
