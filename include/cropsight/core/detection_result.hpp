#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cropsight::core {

/// Provenance tag of results produced by the local prototype classifier.
inline constexpr std::string_view kLocalPrototypeProvenance = "local-prototype";

enum class RiskLevel : std::uint8_t {
  Low,
  Medium,
  High,
  Critical,
};

/// Structured treatment advice, one list per section.
struct TreatmentSections {
  std::vector<std::string> immediate_actions;
  std::vector<std::string> chemical_control;
  std::vector<std::string> organic_control;
  std::vector<std::string> cultural_practices;
  std::vector<std::string> maintenance;

  [[nodiscard]] bool empty() const noexcept {
    return immediate_actions.empty() && chemical_control.empty() && organic_control.empty() &&
           cultural_practices.empty() && maintenance.empty();
  }
};

/// Result of one classify request. Created per request; not mutated after it is returned.
/// Text fields are optional: detection providers usually fill only label/confidence/risk,
/// the enrichment gate supplies the rest (and sets enriched).
struct DetectionResult {
  std::string label;
  float confidence{0.f};
  RiskLevel risk_level{RiskLevel::Low};
  std::string provenance;

  std::optional<std::vector<std::string>> symptoms;
  std::optional<TreatmentSections> treatment;
  std::optional<std::vector<std::string>> prevention;
  std::optional<std::string> prognosis;
  std::optional<std::string> spread_risk;

  /// Extra descriptive fields some providers report.
  std::optional<std::string> plant;
  std::optional<std::string> pathogen;

  bool enriched{false};
};

/// critical >= 0.95, high >= 0.80, medium >= 0.60, low otherwise.
[[nodiscard]] RiskLevel risk_level_from_confidence(float confidence) noexcept;

[[nodiscard]] std::string_view to_string(RiskLevel level) noexcept;

/// Accepts low/medium/high/critical and the severity words providers use
/// (none, moderate, severe), case-insensitive.
[[nodiscard]] std::optional<RiskLevel> parse_risk_level(std::string_view text);

}  // namespace cropsight::core
