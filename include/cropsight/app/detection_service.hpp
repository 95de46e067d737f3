#pragma once

#include <cropsight/core/detection_result.hpp>
#include <cropsight/core/error.hpp>
#include <cropsight/core/image.hpp>
#include <cropsight/core/prototype.hpp>
#include <cropsight/detection/provider_chain.hpp>
#include <cropsight/enrichment/enrichment_gate.hpp>
#include <cropsight/fewshot/learning_pipeline.hpp>
#include <cropsight/fewshot/prototype_store.hpp>
#include <cropsight/vision/embedding_generator.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace cropsight::app {

struct HealthReport {
  std::string embedding_backend;
  bool embedding_ready{false};
  std::size_t embedding_dim{0};
  std::size_t known_classes{0};
  std::vector<std::string> providers;
  bool enrichment_enabled{false};
};

/// Parts a DetectionService is assembled from; see build_service() for the usual wiring.
struct ServiceParts {
  std::shared_ptr<vision::IEmbeddingGenerator> generator;
  std::shared_ptr<fewshot::IPrototypeStore> store;
  detection::ProviderChain chain;
  enrichment::EnrichmentGate gate;
  fewshot::LearningConfig learning;
  std::string prototypes_path;  // empty = do not persist
};

/// classify / learn / list_prototypes / health over the components.
///
/// classify(): provider chain, then the enrichment gate. A chain failure is returned as
/// AllProvidersFailed with every provider's reason; nothing is guessed.
/// learn(): learning pipeline, then (if a prototypes path is set) the whole store is
/// written to disk. A failed write is reported but the class stays learned in memory.
/// Safe to call from several threads.
class DetectionService {
 public:
  explicit DetectionService(ServiceParts parts);

  [[nodiscard]] std::expected<core::DetectionResult, core::Error> classify(
      const core::Image& image,
      const detection::AttemptCallback* on_attempt = nullptr) const;

  [[nodiscard]] std::expected<core::Prototype, core::Error> learn(
      const std::string& label, std::span<const core::Image> exemplars);

  [[nodiscard]] std::vector<core::Prototype> list_prototypes() const;

  [[nodiscard]] HealthReport health() const;

 private:
  std::shared_ptr<vision::IEmbeddingGenerator> generator_;
  std::shared_ptr<fewshot::IPrototypeStore> store_;
  detection::ProviderChain chain_;
  enrichment::EnrichmentGate gate_;
  fewshot::LearningPipeline learner_;
  std::string prototypes_path_;
  std::mutex save_mutex_;
};

}  // namespace cropsight::app
