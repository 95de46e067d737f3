#include <cropsight/enrichment/knowledge_provider.hpp>
#include <cropsight/detection/reply_parsing.hpp>

namespace cropsight::enrichment {

bool Knowledge::empty() const noexcept {
  return symptoms.empty() && treatment.empty() && prevention.empty() && !prognosis &&
         !spread_risk && !plant && !pathogen;
}

Knowledge knowledge_from_json(const nlohmann::json& record) {
  Knowledge k;
  if (!record.is_object()) return k;
  if (auto it = record.find("symptoms"); it != record.end()) {
    k.symptoms = detection::string_list(*it);
  }
  if (auto it = record.find("treatment"); it != record.end()) {
    k.treatment = detection::treatment_from_json(*it);
  }
  if (auto it = record.find("prevention"); it != record.end()) {
    k.prevention = detection::string_list(*it);
  }
  k.prognosis = detection::string_field(record, "prognosis");
  k.spread_risk = detection::string_field(record, "spread_risk");
  k.plant = detection::string_field(record, "plant");
  k.pathogen = detection::string_field(record, "pathogen_name");
  return k;
}

}  // namespace cropsight::enrichment
