#pragma once

#include <cropsight/core/error.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <vector>

namespace cropsight::core {

/// Fixed-length image feature vector. All embeddings in one deployment share
/// the same length (the generator's dimension, 512 by default).
using Embedding = std::vector<float>;

inline constexpr std::size_t kDefaultEmbeddingDim = 512;

[[nodiscard]] float l2_norm(std::span<const float> v) noexcept;

/// Returns v / |v|; a zero vector is returned unchanged.
[[nodiscard]] Embedding l2_normalized(std::span<const float> v);

/// Cosine similarity in [-1, 1]. DimensionMismatch if lengths differ,
/// InvalidInput if either vector is empty or has zero magnitude.
[[nodiscard]] std::expected<float, Error> cosine_similarity(std::span<const float> a,
                                                            std::span<const float> b);

/// Element-wise arithmetic mean. Validation if the list is empty,
/// DimensionMismatch if lengths differ.
[[nodiscard]] std::expected<Embedding, Error> mean_embedding(std::span<const Embedding> embeddings);

/// Maps cosine similarity to confidence: (sim + 1) / 2 clamped to [0, 1].
[[nodiscard]] float similarity_to_confidence(float similarity) noexcept;

}  // namespace cropsight::core
