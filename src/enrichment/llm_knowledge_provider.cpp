#include <cropsight/enrichment/llm_knowledge_provider.hpp>
#include <cropsight/detection/reply_parsing.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace cropsight::enrichment {

using json = nlohmann::json;

namespace {

constexpr const char* kSystemPrompt =
    "You are an expert plant pathologist providing detailed disease information in JSON "
    "format only.";

std::string user_prompt(const std::string& label, float confidence) {
  std::ostringstream p;
  p << "Provide comprehensive information about the plant disease: \"" << label << "\".\n\n"
    << "Respond with ONLY valid JSON in this exact format:\n"
    << "{\n"
    << "  \"disease_name\": \"" << label << "\",\n"
    << "  \"confidence\": " << confidence << ",\n"
    << "  \"plant\": \"Common plant name affected\",\n"
    << "  \"pathogen_name\": \"Scientific name of pathogen or null\",\n"
    << "  \"symptoms\": [\"symptom 1\", \"symptom 2\", \"symptom 3\"],\n"
    << "  \"treatment\": {\n"
    << "    \"immediate_actions\": [\"action 1\"],\n"
    << "    \"chemical_control\": [\"treatment 1\"],\n"
    << "    \"organic_control\": [\"organic method 1\"],\n"
    << "    \"cultural_practices\": [\"practice 1\"],\n"
    << "    \"maintenance\": [\"maintenance task 1\"]\n"
    << "  },\n"
    << "  \"prevention\": [\"prevention tip 1\", \"prevention tip 2\"],\n"
    << "  \"prognosis\": \"Expected outcome with and without treatment\",\n"
    << "  \"spread_risk\": \"How quickly the disease spreads\"\n"
    << "}";
  return p.str();
}

core::Error enrichment_error(std::string message) {
  return core::make_error(core::ErrorCode::EnrichmentFailed, std::move(message));
}

}  // namespace

LlmKnowledgeProvider::LlmKnowledgeProvider(std::shared_ptr<detection::IHttpTransport> transport,
                                           LlmKnowledgeConfig cfg)
    : transport_(std::move(transport)), cfg_(std::move(cfg)) {
  if (!transport_) {
    throw std::invalid_argument("LlmKnowledgeProvider: transport is required");
  }
}

std::expected<Knowledge, core::Error> LlmKnowledgeProvider::generate_knowledge(
    const std::string& label, float confidence, std::stop_token stop) {
  if (cfg_.api_key.empty()) {
    return std::unexpected(enrichment_error(cfg_.id + ": API key is not set"));
  }

  json body = {
      {"model", cfg_.model},
      {"messages",
       json::array({{{"role", "system"}, {"content", kSystemPrompt}},
                    {{"role", "user"}, {"content", user_prompt(label, confidence)}}})},
      {"temperature", cfg_.temperature},
      {"max_tokens", cfg_.max_tokens},
      {"response_format", {{"type", "json_object"}}},
  };

  detection::HttpRequest req;
  req.base_url = cfg_.base_url;
  req.path = cfg_.path;
  req.headers = {{"Authorization", "Bearer " + cfg_.api_key}};
  req.body = body.dump();
  req.timeout = cfg_.request_timeout;

  auto res = transport_->post(req, stop);
  if (!res) {
    return std::unexpected(enrichment_error(cfg_.id + ": " + res.error().message));
  }
  auto payload = detection::parse_http_json(res->status, res->body);
  if (!payload) {
    return std::unexpected(enrichment_error(cfg_.id + ": " + payload.error().message));
  }

  std::string text;
  try {
    text = payload->at("choices").at(0).at("message").at("content").get<std::string>();
  } catch (const json::exception& e) {
    std::cerr << "[LlmKnowledgeProvider] " << cfg_.id << ": unexpected response shape: "
              << e.what() << "\n";
    return std::unexpected(enrichment_error(cfg_.id + " response has no message content"));
  }

  auto record = detection::extract_json_object(text);
  if (!record) {
    return std::unexpected(enrichment_error(cfg_.id + ": " + record.error().message));
  }
  Knowledge k = knowledge_from_json(*record);
  if (k.empty()) {
    return std::unexpected(enrichment_error(cfg_.id + " returned no usable fields"));
  }
  return k;
}

}  // namespace cropsight::enrichment
