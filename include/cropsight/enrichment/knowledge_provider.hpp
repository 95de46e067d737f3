#pragma once

#include <cropsight/core/detection_result.hpp>
#include <cropsight/core/error.hpp>
#include <nlohmann/json.hpp>
#include <expected>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace cropsight::enrichment {

/// Supplemental text about a class, as produced by a knowledge provider.
struct Knowledge {
  std::vector<std::string> symptoms;
  core::TreatmentSections treatment;
  std::vector<std::string> prevention;
  std::optional<std::string> prognosis;
  std::optional<std::string> spread_risk;
  std::optional<std::string> plant;
  std::optional<std::string> pathogen;

  /// True when no field carries any text.
  [[nodiscard]] bool empty() const noexcept;
};

/// Reads symptoms, treatment sections, prevention, prognosis, spread_risk, plant and
/// pathogen_name from a disease record; unknown members are ignored.
[[nodiscard]] Knowledge knowledge_from_json(const nlohmann::json& record);

/// Generates supplemental text for a detected class.
class IKnowledgeProvider {
 public:
  virtual ~IKnowledgeProvider() = default;

  [[nodiscard]] virtual std::string id() const = 0;

  [[nodiscard]] virtual std::expected<Knowledge, core::Error> generate_knowledge(
      const std::string& label, float confidence, std::stop_token stop) = 0;
};

}  // namespace cropsight::enrichment
