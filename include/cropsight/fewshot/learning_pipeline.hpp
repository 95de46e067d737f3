#pragma once

#include <cropsight/core/error.hpp>
#include <cropsight/core/image.hpp>
#include <cropsight/core/prototype.hpp>
#include <cropsight/fewshot/prototype_store.hpp>
#include <cropsight/vision/embedding_generator.hpp>
#include <cstddef>
#include <expected>
#include <memory>
#include <span>
#include <string>

namespace cropsight::fewshot {

struct LearningConfig {
  std::size_t min_exemplars{5};
  std::size_t max_exemplars{10};
  /// Recorded on new prototypes; the pipeline does not hold out exemplars to measure it.
  float estimated_accuracy{0.95f};
};

/// Builds a prototype for a new class from a handful of exemplar images.
///
/// learn(): validate count and label, reject an existing label, embed every exemplar
/// on its own thread, join, average, put. Any embedding failure aborts the whole call
/// and nothing is stored. The generator and store are shared with the classify path.
class LearningPipeline {
 public:
  LearningPipeline(std::shared_ptr<vision::IEmbeddingGenerator> generator,
                   std::shared_ptr<IPrototypeStore> store,
                   LearningConfig cfg = {});

  /// Validation for a bad count or an empty label, DuplicateClass for a known label,
  /// the generator's error (InvalidInput, ...) if an exemplar cannot be embedded.
  [[nodiscard]] std::expected<core::Prototype, core::Error> learn(
      const std::string& label, std::span<const core::Image> exemplars);

  [[nodiscard]] const LearningConfig& config() const noexcept { return cfg_; }

 private:
  std::shared_ptr<vision::IEmbeddingGenerator> generator_;
  std::shared_ptr<IPrototypeStore> store_;
  LearningConfig cfg_;
};

}  // namespace cropsight::fewshot
