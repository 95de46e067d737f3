#include <cropsight/detection/local_prototype_provider.hpp>
#include <stdexcept>
#include <utility>
#include <vector>

namespace cropsight::detection {

namespace {

core::Error cancelled() {
  return core::make_error(core::ErrorCode::Timeout, "local classification cancelled");
}

}  // namespace

LocalPrototypeProvider::LocalPrototypeProvider(
    std::shared_ptr<vision::IEmbeddingGenerator> generator,
    std::shared_ptr<const fewshot::IPrototypeStore> store,
    fewshot::PrototypeClassifier classifier)
    : generator_(std::move(generator)), store_(std::move(store)), classifier_(classifier) {
  if (!generator_ || !store_) {
    throw std::invalid_argument("LocalPrototypeProvider: generator and store are required");
  }
}

std::expected<fewshot::Classification, core::Error> LocalPrototypeProvider::match(
    const core::Image& image, std::stop_token stop) {
  // Checked first so an empty store never pays for an embedding.
  const std::vector<core::Prototype> prototypes = store_->all();
  if (prototypes.empty()) {
    return std::unexpected(
        core::make_error(core::ErrorCode::NoPrototypes, "no prototypes learned yet"));
  }
  if (stop.stop_requested()) {
    return std::unexpected(cancelled());
  }

  auto embedding = generator_->embed(image, stop);
  if (!embedding) {
    return std::unexpected(embedding.error());
  }
  if (stop.stop_requested()) {
    return std::unexpected(cancelled());
  }
  return classifier_.classify(*embedding, prototypes);
}

std::expected<core::DetectionResult, core::Error> LocalPrototypeProvider::detect(
    const core::Image& image, std::stop_token stop) {
  auto match_result = match(image, stop);
  if (!match_result) {
    return std::unexpected(match_result.error());
  }
  core::DetectionResult result;
  result.label = match_result->label;
  result.confidence = match_result->confidence;
  result.risk_level = core::risk_level_from_confidence(result.confidence);
  result.provenance = id();
  return result;
}

}  // namespace cropsight::detection
