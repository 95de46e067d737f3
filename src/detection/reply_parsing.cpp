#include <cropsight/detection/reply_parsing.hpp>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace cropsight::detection {

using json = nlohmann::json;

namespace {

constexpr std::size_t kMaxErrorBody = 300;

core::Error provider_error(std::string message) {
  return core::make_error(core::ErrorCode::ProviderFailed, std::move(message));
}

std::optional<float> number_field(const json& obj, std::string_view key) {
  auto it = obj.find(std::string(key));
  if (it == obj.end()) return std::nullopt;
  if (it->is_number()) return it->get<float>();
  if (it->is_string()) {
    // "87%" or "0.87"
    const std::string s = it->get<std::string>();
    try {
      return std::stof(s);
    } catch (const std::exception&) {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

}  // namespace

std::expected<json, core::Error> extract_json_object(std::string_view text) {
  const auto open = text.find('{');
  const auto close = text.rfind('}');
  if (open == std::string_view::npos || close == std::string_view::npos || close < open) {
    return std::unexpected(provider_error("no JSON object in model reply"));
  }
  try {
    json parsed = json::parse(text.substr(open, close - open + 1));
    if (!parsed.is_object()) {
      return std::unexpected(provider_error("model reply is not a JSON object"));
    }
    return parsed;
  } catch (const json::parse_error& e) {
    return std::unexpected(provider_error(std::string("malformed JSON in model reply: ") + e.what()));
  }
}

std::vector<std::string> string_list(const json& v) {
  std::vector<std::string> out;
  if (!v.is_array()) return out;
  for (const auto& item : v) {
    if (!item.is_string()) continue;
    std::string s = item.get<std::string>();
    if (s.find_first_not_of(" \t\r\n") == std::string::npos) continue;
    out.push_back(std::move(s));
  }
  return out;
}

std::optional<std::string> string_field(const json& obj, std::string_view key) {
  if (!obj.is_object()) return std::nullopt;
  auto it = obj.find(std::string(key));
  if (it == obj.end() || !it->is_string()) return std::nullopt;
  std::string s = it->get<std::string>();
  if (s.empty()) return std::nullopt;
  return s;
}

core::TreatmentSections treatment_from_json(const json& v) {
  core::TreatmentSections t;
  if (!v.is_object()) return t;
  if (auto it = v.find("immediate_actions"); it != v.end()) t.immediate_actions = string_list(*it);
  if (auto it = v.find("chemical_control"); it != v.end()) t.chemical_control = string_list(*it);
  if (auto it = v.find("organic_control"); it != v.end()) t.organic_control = string_list(*it);
  if (auto it = v.find("cultural_practices"); it != v.end()) t.cultural_practices = string_list(*it);
  if (auto it = v.find("maintenance"); it != v.end()) t.maintenance = string_list(*it);
  return t;
}

std::expected<core::DetectionResult, core::Error> detection_from_reply(const json& reply) {
  if (!reply.is_object()) {
    return std::unexpected(provider_error("model reply is not a JSON object"));
  }

  core::DetectionResult r;
  for (std::string_view key : {"disease_name", "pestName", "label"}) {
    if (auto s = string_field(reply, key)) {
      r.label = *s;
      break;
    }
  }
  if (r.label.empty()) {
    return std::unexpected(provider_error("model reply has no disease_name"));
  }

  auto confidence = number_field(reply, "confidence");
  if (!confidence) {
    return std::unexpected(provider_error("model reply has no confidence"));
  }
  float c = *confidence;
  if (c > 1.f && c <= 100.f) c /= 100.f;
  r.confidence = std::clamp(c, 0.f, 1.f);

  r.risk_level = core::risk_level_from_confidence(r.confidence);
  for (std::string_view key : {"risk_level", "riskLevel", "severity"}) {
    if (auto s = string_field(reply, key)) {
      if (auto level = core::parse_risk_level(*s)) {
        r.risk_level = *level;
        break;
      }
    }
  }

  if (auto it = reply.find("symptoms"); it != reply.end()) {
    auto symptoms = string_list(*it);
    if (!symptoms.empty()) r.symptoms = std::move(symptoms);
  }
  if (auto it = reply.find("treatment"); it != reply.end()) {
    auto treatment = treatment_from_json(*it);
    if (!treatment.empty()) r.treatment = std::move(treatment);
  }
  if (auto it = reply.find("prevention"); it != reply.end()) {
    auto prevention = string_list(*it);
    if (!prevention.empty()) r.prevention = std::move(prevention);
  }
  r.plant = string_field(reply, "plant");
  r.pathogen = string_field(reply, "pathogen_name");
  return r;
}

std::expected<json, core::Error> parse_http_json(int status, const std::string& body) {
  if (status < 200 || status >= 300) {
    std::string snippet = body.substr(0, std::min(body.size(), kMaxErrorBody));
    return std::unexpected(
        provider_error("HTTP " + std::to_string(status) + (snippet.empty() ? "" : ": " + snippet)));
  }
  try {
    return json::parse(body);
  } catch (const json::parse_error& e) {
    return std::unexpected(provider_error(std::string("malformed response body: ") + e.what()));
  }
}

}  // namespace cropsight::detection
