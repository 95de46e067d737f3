#include <cropsight/app/detection_service.hpp>
#include <cropsight/app/prototype_io.hpp>
#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace cropsight::app {

DetectionService::DetectionService(ServiceParts parts)
    : generator_(std::move(parts.generator)),
      store_(std::move(parts.store)),
      chain_(std::move(parts.chain)),
      gate_(std::move(parts.gate)),
      learner_(generator_, store_, parts.learning),
      prototypes_path_(std::move(parts.prototypes_path)) {}

std::expected<core::DetectionResult, core::Error> DetectionService::classify(
    const core::Image& image, const detection::AttemptCallback* on_attempt) const {
  if (image.empty()) {
    return std::unexpected(core::make_error(core::ErrorCode::InvalidInput, "empty image"));
  }
  auto detected = chain_.detect(image, on_attempt);
  if (!detected) {
    return std::unexpected(detected.error());
  }
  return gate_.apply(*detected);
}

std::expected<core::Prototype, core::Error> DetectionService::learn(
    const std::string& label, std::span<const core::Image> exemplars) {
  auto prototype = learner_.learn(label, exemplars);
  if (!prototype) {
    return prototype;
  }
  if (!prototypes_path_.empty()) {
    std::lock_guard lock(save_mutex_);
    auto saved = save_prototypes(prototypes_path_, store_->all());
    if (!saved) {
      std::cerr << "[DetectionService] learned '" << label
                << "' but could not persist prototypes: " << saved.error().message << "\n";
    }
  }
  return prototype;
}

std::vector<core::Prototype> DetectionService::list_prototypes() const {
  auto all = store_->all();
  std::sort(all.begin(), all.end(), [](const core::Prototype& a, const core::Prototype& b) {
    return core::label_key(a.label) < core::label_key(b.label);
  });
  return all;
}

HealthReport DetectionService::health() const {
  HealthReport h;
  h.embedding_backend = generator_->name();
  h.embedding_dim = generator_->dimension();
  h.embedding_ready = h.embedding_dim > 0;
  h.known_classes = store_->size();
  h.providers = chain_.provider_ids();
  h.enrichment_enabled = gate_.enabled();
  return h;
}

}  // namespace cropsight::app
