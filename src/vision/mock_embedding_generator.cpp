#include <cropsight/vision/mock_embedding_generator.hpp>
#include <cropsight/vision/load_image.hpp>
#include <condition_variable>
#include <cstdint>
#include <random>
#include <vector>

namespace cropsight::vision {

namespace {

std::uint64_t fnv1a(const std::string& s) {
  std::uint64_t h = 1469598103934665603ull;
  for (unsigned char c : s) {
    h ^= c;
    h *= 1099511628211ull;
  }
  return h;
}

}  // namespace

MockEmbeddingGenerator::MockEmbeddingGenerator(std::size_t dim, std::size_t max_image_bytes)
    : dim_(dim), max_image_bytes_(max_image_bytes) {}

std::string MockEmbeddingGenerator::key_of(const core::Image& image) {
  const auto bytes = image.bytes();
  return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

void MockEmbeddingGenerator::set_embedding(const core::Image& image, core::Embedding embedding) {
  std::lock_guard lock(mutex_);
  embeddings_[key_of(image)] = std::move(embedding);
}

void MockEmbeddingGenerator::set_failure(const core::Image& image, core::Error error) {
  std::lock_guard lock(mutex_);
  failures_[key_of(image)] = std::move(error);
}

void MockEmbeddingGenerator::set_delay(std::chrono::milliseconds delay) {
  std::lock_guard lock(mutex_);
  delay_ = delay;
}

std::expected<void, core::Error> MockEmbeddingGenerator::validate_input(
    const core::Image& image) const {
  return check_image_size(image, max_image_bytes_);
}

std::expected<core::Embedding, core::Error> MockEmbeddingGenerator::embed(
    const core::Image& image, std::stop_token stop) {
  calls_++;
  auto valid = validate_input(image);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  std::chrono::milliseconds delay{0};
  {
    std::lock_guard lock(mutex_);
    delay = delay_;
  }
  if (delay.count() > 0) {
    // Private mutex so concurrent embeds wait independently.
    std::mutex wait_mutex;
    std::unique_lock wait_lock(wait_mutex);
    std::condition_variable_any cv;
    if (cv.wait_for(wait_lock, stop, delay, [] { return false; }) || stop.stop_requested()) {
      cancellations_++;
      return std::unexpected(core::make_error(core::ErrorCode::Timeout, "embedding cancelled"));
    }
  }

  const std::string key = key_of(image);
  {
    std::lock_guard lock(mutex_);
    if (auto it = failures_.find(key); it != failures_.end()) {
      return std::unexpected(it->second);
    }
    if (auto it = embeddings_.find(key); it != embeddings_.end()) {
      return it->second;
    }
  }

  std::mt19937_64 rng(fnv1a(key));
  std::normal_distribution<float> dist(0.f, 1.f);
  core::Embedding e(dim_);
  for (auto& x : e) x = dist(rng);
  return core::l2_normalized(e);
}

}  // namespace cropsight::vision
