#pragma once

#include <cropsight/core/embedding.hpp>
#include <cropsight/core/error.hpp>
#include <cropsight/core/image.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <stop_token>
#include <string>
#include <vector>

namespace cropsight::vision {

/// Abstract embedding generator: Image -> fixed-length Embedding.
/// Implement embed(), dimension() and name(); optionally override validate_input,
/// embed_batch, warmup.
/// embed() must be deterministic for a fixed model and safe to call from several
/// threads at once (the learning pipeline embeds exemplars concurrently).
class IEmbeddingGenerator {
 public:
  virtual ~IEmbeddingGenerator() = default;

  /// InvalidInput when the image cannot be decoded or violates the size limit.
  /// Timeout when `stop` is requested before the embedding is ready; implementations
  /// abandon inference as soon as they observe the request.
  [[nodiscard]] virtual std::expected<core::Embedding, core::Error> embed(
      const core::Image& image, std::stop_token stop = {}) = 0;

  /// Length of every embedding this generator returns.
  [[nodiscard]] virtual std::size_t dimension() const noexcept = 0;

  /// Short backend name for logs and health reports (e.g. "onnx", "mock").
  [[nodiscard]] virtual std::string name() const = 0;

  /// Optional: cheap checks before decoding. Default: reject empty images.
  [[nodiscard]] virtual std::expected<void, core::Error> validate_input(
      const core::Image& image) const;

  /// Optional: batch embedding. Default: loop over embed(), stop at the first failure.
  [[nodiscard]] virtual std::expected<std::vector<core::Embedding>, core::Error> embed_batch(
      std::span<const core::Image> images);

  /// Optional: warmup run. Call once after construction. Default: no-op.
  virtual void warmup() {}
};

}  // namespace cropsight::vision
