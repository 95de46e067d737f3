#pragma once

#include <cropsight/core/embedding.hpp>
#include <cropsight/core/error.hpp>
#include <cropsight/core/image.hpp>
#include <cropsight/vision/embedding_generator.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <stop_token>
#include <string>

namespace cropsight::vision {

/// Mock generator for tests and demos. No decoding: an image is identified by its bytes.
///
/// Images registered with set_embedding() return that vector; images registered with
/// set_failure() return that error; any other image gets a deterministic pseudo-random
/// unit vector seeded from a hash of its bytes, so identical bytes always embed identically.
/// set_delay() makes every embed() wait first; a stop request ends the wait with Timeout.
class MockEmbeddingGenerator : public IEmbeddingGenerator {
 public:
  explicit MockEmbeddingGenerator(std::size_t dim = core::kDefaultEmbeddingDim,
                                  std::size_t max_image_bytes = 10u * 1024u * 1024u);

  void set_embedding(const core::Image& image, core::Embedding embedding);
  void set_failure(const core::Image& image, core::Error error);
  void set_delay(std::chrono::milliseconds delay);

  [[nodiscard]] std::expected<core::Embedding, core::Error> embed(
      const core::Image& image, std::stop_token stop = {}) override;

  [[nodiscard]] std::expected<void, core::Error> validate_input(
      const core::Image& image) const override;

  [[nodiscard]] std::size_t dimension() const noexcept override { return dim_; }

  [[nodiscard]] std::string name() const override { return "mock"; }

  /// Number of embed() calls so far (successful or not).
  [[nodiscard]] std::size_t calls() const noexcept { return calls_.load(); }

  /// Number of embed() calls that ended because of a stop request.
  [[nodiscard]] std::size_t cancellations() const noexcept { return cancellations_.load(); }

 private:
  [[nodiscard]] static std::string key_of(const core::Image& image);

  std::size_t dim_;
  std::size_t max_image_bytes_;
  mutable std::mutex mutex_;
  std::map<std::string, core::Embedding> embeddings_;
  std::map<std::string, core::Error> failures_;
  std::chrono::milliseconds delay_{0};
  std::atomic<std::size_t> calls_{0};
  std::atomic<std::size_t> cancellations_{0};
};

}  // namespace cropsight::vision
