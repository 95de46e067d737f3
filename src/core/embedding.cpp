#include <cropsight/core/embedding.hpp>
#include <algorithm>
#include <cmath>
#include <string>

namespace cropsight::core {

float l2_norm(std::span<const float> v) noexcept {
  double sum = 0.0;
  for (float x : v) sum += static_cast<double>(x) * x;
  return static_cast<float>(std::sqrt(sum));
}

Embedding l2_normalized(std::span<const float> v) {
  Embedding out(v.begin(), v.end());
  const float norm = l2_norm(v);
  if (norm == 0.f) return out;
  for (auto& x : out) x /= norm;
  return out;
}

std::expected<float, Error> cosine_similarity(std::span<const float> a,
                                              std::span<const float> b) {
  if (a.size() != b.size()) {
    return std::unexpected(make_error(
        ErrorCode::DimensionMismatch,
        "embedding length " + std::to_string(a.size()) + " vs " + std::to_string(b.size())));
  }
  if (a.empty()) {
    return std::unexpected(make_error(ErrorCode::InvalidInput, "empty embedding"));
  }
  double dot = 0.0;
  double na = 0.0;
  double nb = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * b[i];
    na += static_cast<double>(a[i]) * a[i];
    nb += static_cast<double>(b[i]) * b[i];
  }
  if (na == 0.0 || nb == 0.0) {
    return std::unexpected(make_error(ErrorCode::InvalidInput, "zero-magnitude embedding"));
  }
  const double sim = dot / (std::sqrt(na) * std::sqrt(nb));
  return static_cast<float>(std::clamp(sim, -1.0, 1.0));
}

std::expected<Embedding, Error> mean_embedding(std::span<const Embedding> embeddings) {
  if (embeddings.empty()) {
    return std::unexpected(make_error(ErrorCode::Validation, "no embeddings to average"));
  }
  const std::size_t dim = embeddings.front().size();
  std::vector<double> sum(dim, 0.0);
  for (const auto& e : embeddings) {
    if (e.size() != dim) {
      return std::unexpected(make_error(
          ErrorCode::DimensionMismatch,
          "exemplar embedding length " + std::to_string(e.size()) + " vs " + std::to_string(dim)));
    }
    for (std::size_t i = 0; i < dim; ++i) sum[i] += e[i];
  }
  Embedding mean(dim);
  const double n = static_cast<double>(embeddings.size());
  for (std::size_t i = 0; i < dim; ++i) mean[i] = static_cast<float>(sum[i] / n);
  return mean;
}

float similarity_to_confidence(float similarity) noexcept {
  return std::clamp((similarity + 1.f) / 2.f, 0.f, 1.f);
}

}  // namespace cropsight::core
