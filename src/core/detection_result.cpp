#include <cropsight/core/detection_result.hpp>
#include <cropsight/core/prototype.hpp>

namespace cropsight::core {

RiskLevel risk_level_from_confidence(float confidence) noexcept {
  if (confidence >= 0.95f) return RiskLevel::Critical;
  if (confidence >= 0.80f) return RiskLevel::High;
  if (confidence >= 0.60f) return RiskLevel::Medium;
  return RiskLevel::Low;
}

std::string_view to_string(RiskLevel level) noexcept {
  switch (level) {
    case RiskLevel::Low:
      return "low";
    case RiskLevel::Medium:
      return "medium";
    case RiskLevel::High:
      return "high";
    case RiskLevel::Critical:
      return "critical";
    default:
      return "unknown";
  }
}

std::optional<RiskLevel> parse_risk_level(std::string_view text) {
  const std::string key = label_key(text);
  if (key == "low" || key == "none") return RiskLevel::Low;
  if (key == "medium" || key == "moderate") return RiskLevel::Medium;
  if (key == "high" || key == "severe") return RiskLevel::High;
  if (key == "critical") return RiskLevel::Critical;
  return std::nullopt;
}

}  // namespace cropsight::core
