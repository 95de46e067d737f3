#include <cropsight/enrichment/enrichment_gate.hpp>
#include <cropsight/core/timed_call.hpp>
#include <algorithm>
#include <cctype>
#include <iostream>
#include <utility>

namespace cropsight::enrichment {

namespace {

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

bool has_text(const std::optional<std::string>& s) {
  return s && !s->empty();
}

}  // namespace

EnrichmentGate::EnrichmentGate(std::shared_ptr<IKnowledgeProvider> provider, EnrichmentConfig cfg)
    : provider_(std::move(provider)), cfg_(std::move(cfg)) {}

bool EnrichmentGate::symptoms_missing(const core::DetectionResult& result) const {
  if (!result.symptoms || result.symptoms->empty()) return true;
  if (result.symptoms->size() != 1u || cfg_.sentinel.empty()) return false;
  return lowercase(result.symptoms->front()).find(lowercase(cfg_.sentinel)) != std::string::npos;
}

bool EnrichmentGate::should_enrich(const core::DetectionResult& result) const {
  if (result.confidence < cfg_.threshold) return true;
  if (symptoms_missing(result)) return true;
  if (!result.treatment || result.treatment->empty()) return true;
  if (!result.prevention || result.prevention->empty()) return true;
  return false;
}

core::DetectionResult EnrichmentGate::merge(const core::DetectionResult& result,
                                            const Knowledge& knowledge) {
  core::DetectionResult out = result;
  if (!knowledge.symptoms.empty()) out.symptoms = knowledge.symptoms;
  if (!knowledge.treatment.empty()) out.treatment = knowledge.treatment;
  if (!knowledge.prevention.empty()) out.prevention = knowledge.prevention;
  if (has_text(knowledge.prognosis)) out.prognosis = knowledge.prognosis;
  if (has_text(knowledge.spread_risk)) out.spread_risk = knowledge.spread_risk;
  if (has_text(knowledge.plant)) out.plant = knowledge.plant;
  if (has_text(knowledge.pathogen)) out.pathogen = knowledge.pathogen;
  out.enriched = true;
  return out;
}

std::expected<core::DetectionResult, core::Error> EnrichmentGate::try_enrich(
    const core::DetectionResult& result) const {
  if (!provider_) {
    return std::unexpected(
        core::make_error(core::ErrorCode::EnrichmentFailed, "no knowledge provider configured"));
  }
  auto provider = provider_;
  auto knowledge = core::call_with_timeout<Knowledge>(
      [provider, label = result.label, confidence = result.confidence](std::stop_token stop) {
        return provider->generate_knowledge(label, confidence, stop);
      },
      cfg_.timeout, core::ErrorCode::EnrichmentFailed);
  if (!knowledge) {
    return std::unexpected(knowledge.error());
  }
  if (knowledge->empty()) {
    return std::unexpected(core::make_error(core::ErrorCode::EnrichmentFailed,
                                            provider_->id() + " returned no usable fields"));
  }
  return merge(result, *knowledge);
}

core::DetectionResult EnrichmentGate::enrich(const core::DetectionResult& result) const {
  auto enriched = try_enrich(result);
  if (!enriched) {
    std::cerr << "[EnrichmentGate] " << (provider_ ? provider_->id() : std::string("none"))
              << " for '" << result.label << "': " << core::describe(enriched.error()) << "\n";
    return result;
  }
  return *enriched;
}

core::DetectionResult EnrichmentGate::apply(const core::DetectionResult& result) const {
  if (!provider_ || !should_enrich(result)) {
    return result;
  }
  return enrich(result);
}

}  // namespace cropsight::enrichment
