#include <cropsight/vision/embedding_generator.hpp>
#include <span>
#include <vector>

namespace cropsight::vision {

std::expected<void, core::Error> IEmbeddingGenerator::validate_input(
    const core::Image& image) const {
  if (image.empty()) {
    return std::unexpected(core::make_error(core::ErrorCode::InvalidInput, "empty image"));
  }
  return {};
}

std::expected<std::vector<core::Embedding>, core::Error> IEmbeddingGenerator::embed_batch(
    std::span<const core::Image> images) {
  std::vector<core::Embedding> results;
  results.reserve(images.size());
  for (const auto& image : images) {
    auto single = embed(image);
    if (!single) {
      return std::unexpected(single.error());
    }
    results.push_back(std::move(*single));
  }
  return results;
}

}  // namespace cropsight::vision
