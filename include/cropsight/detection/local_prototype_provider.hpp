#pragma once

#include <cropsight/core/detection_result.hpp>
#include <cropsight/core/error.hpp>
#include <cropsight/core/image.hpp>
#include <cropsight/detection/detection_provider.hpp>
#include <cropsight/fewshot/prototype_classifier.hpp>
#include <cropsight/fewshot/prototype_store.hpp>
#include <cropsight/vision/embedding_generator.hpp>
#include <expected>
#include <memory>
#include <stop_token>
#include <string>

namespace cropsight::detection {

/// Local path: embed the image and match it against the stored prototypes.
/// NoPrototypes while the store is empty, which the chain treats as "skip to the next
/// provider". Risk level is derived from confidence.
class LocalPrototypeProvider : public IDetectionProvider {
 public:
  LocalPrototypeProvider(std::shared_ptr<vision::IEmbeddingGenerator> generator,
                         std::shared_ptr<const fewshot::IPrototypeStore> store,
                         fewshot::PrototypeClassifier classifier = fewshot::PrototypeClassifier{});

  [[nodiscard]] std::string id() const override { return std::string(core::kLocalPrototypeProvenance); }

  [[nodiscard]] std::expected<core::DetectionResult, core::Error> detect(
      const core::Image& image, std::stop_token stop) override;

  /// Full classification including the runner-up, for diagnostics.
  [[nodiscard]] std::expected<fewshot::Classification, core::Error> match(
      const core::Image& image, std::stop_token stop = {});

 private:
  std::shared_ptr<vision::IEmbeddingGenerator> generator_;
  std::shared_ptr<const fewshot::IPrototypeStore> store_;
  fewshot::PrototypeClassifier classifier_;
};

}  // namespace cropsight::detection
