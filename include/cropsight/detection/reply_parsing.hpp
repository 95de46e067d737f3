#pragma once

#include <cropsight/core/detection_result.hpp>
#include <cropsight/core/error.hpp>
#include <nlohmann/json.hpp>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cropsight::detection {

/// Pulls the JSON object out of model text: tolerates ```json fences and prose around
/// the object (everything from the first '{' to the last '}'). ProviderFailed if no
/// object is found or it does not parse.
[[nodiscard]] std::expected<nlohmann::json, core::Error> extract_json_object(std::string_view text);

/// Detection fields from a vision model reply: label from disease_name / pestName /
/// label, confidence (0..1, or a percentage), risk from risk_level / riskLevel / severity
/// (derived from confidence when absent or unknown), plus any of symptoms, plant,
/// pathogen_name, treatment and prevention. ProviderFailed without a label or confidence.
[[nodiscard]] std::expected<core::DetectionResult, core::Error> detection_from_reply(
    const nlohmann::json& reply);

/// Array of strings; non-string entries and blanks are skipped. Empty if `v` is not an array.
[[nodiscard]] std::vector<std::string> string_list(const nlohmann::json& v);

/// Non-empty string member `key`, if present.
[[nodiscard]] std::optional<std::string> string_field(const nlohmann::json& obj,
                                                      std::string_view key);

/// The five treatment sections; missing sections stay empty.
[[nodiscard]] core::TreatmentSections treatment_from_json(const nlohmann::json& v);

/// Status/body check shared by the HTTP providers: ProviderFailed unless 2xx.
[[nodiscard]] std::expected<nlohmann::json, core::Error> parse_http_json(int status,
                                                                       const std::string& body);

}  // namespace cropsight::detection
