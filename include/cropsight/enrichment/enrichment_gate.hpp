#pragma once

#include <cropsight/core/detection_result.hpp>
#include <cropsight/core/error.hpp>
#include <cropsight/enrichment/knowledge_provider.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <string>

namespace cropsight::enrichment {

struct EnrichmentConfig {
  float threshold{0.65f};
  std::chrono::milliseconds timeout{8000};  // 0 = no deadline
  /// Symptoms consisting only of this text (case-insensitive) count as missing.
  std::string sentinel{"information not available"};
};

/// Decides whether a detection result needs supplemental text and fetches it.
///
/// should_enrich() is true when confidence is below the threshold, when symptoms are
/// missing or only the sentinel, or when treatment or prevention is missing.
/// enrich() keeps label, confidence, risk_level and provenance and takes the text fields
/// from the knowledge output. Enrichment is best-effort: on any failure the input comes
/// back unchanged.
class EnrichmentGate {
 public:
  /// A null provider disables enrichment; apply() then returns its input.
  explicit EnrichmentGate(std::shared_ptr<IKnowledgeProvider> provider = nullptr,
                          EnrichmentConfig cfg = {});

  [[nodiscard]] bool should_enrich(const core::DetectionResult& result) const;

  /// Calls the knowledge provider and merges; the input on failure.
  [[nodiscard]] core::DetectionResult enrich(const core::DetectionResult& result) const;

  /// Same as enrich() but reports the failure: EnrichmentFailed, Timeout or NotFound.
  [[nodiscard]] std::expected<core::DetectionResult, core::Error> try_enrich(
      const core::DetectionResult& result) const;

  /// should_enrich() ? enrich() : result.
  [[nodiscard]] core::DetectionResult apply(const core::DetectionResult& result) const;

  [[nodiscard]] bool enabled() const noexcept { return provider_ != nullptr; }
  [[nodiscard]] const EnrichmentConfig& config() const noexcept { return cfg_; }

  /// Text fields from `knowledge` replace those of `result` when non-empty;
  /// the rest of `result` is kept. Sets enriched.
  [[nodiscard]] static core::DetectionResult merge(const core::DetectionResult& result,
                                                   const Knowledge& knowledge);

 private:
  [[nodiscard]] bool symptoms_missing(const core::DetectionResult& result) const;

  std::shared_ptr<IKnowledgeProvider> provider_;
  EnrichmentConfig cfg_;
};

}  // namespace cropsight::enrichment
