#include <cropsight/detection/gemini_vision_provider.hpp>
#include <cropsight/detection/reply_parsing.hpp>
#include <cropsight/detection/vision_prompt.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace cropsight::detection {

using json = nlohmann::json;

GeminiVisionProvider::GeminiVisionProvider(std::shared_ptr<IHttpTransport> transport,
                                           GeminiConfig cfg)
    : transport_(std::move(transport)), cfg_(std::move(cfg)) {
  if (!transport_) {
    throw std::invalid_argument("GeminiVisionProvider: transport is required");
  }
}

std::expected<core::DetectionResult, core::Error> GeminiVisionProvider::detect(
    const core::Image& image, std::stop_token stop) {
  if (cfg_.api_key.empty()) {
    return std::unexpected(
        core::make_error(core::ErrorCode::ProviderFailed, "GEMINI_API_KEY is not set"));
  }
  if (image.empty()) {
    return std::unexpected(core::make_error(core::ErrorCode::InvalidInput, "empty image"));
  }

  json body = {
      {"contents",
       json::array({{{"parts",
                      json::array({{{"text", std::string(kVisionPrompt)}},
                                   {{"inline_data",
                                     {{"mime_type", image.mime_type()},
                                      {"data", image.to_base64()}}}}})}}})},
      {"generationConfig",
       {{"temperature", cfg_.temperature}, {"maxOutputTokens", cfg_.max_output_tokens}}},
  };

  HttpRequest req;
  req.base_url = cfg_.base_url;
  req.path = "/v1beta/models/" + cfg_.model + ":generateContent";
  req.headers = {{"x-goog-api-key", cfg_.api_key}};
  req.body = body.dump();
  req.timeout = cfg_.request_timeout;

  auto res = transport_->post(req, stop);
  if (!res) {
    return std::unexpected(res.error());
  }
  auto payload = parse_http_json(res->status, res->body);
  if (!payload) {
    return std::unexpected(payload.error());
  }

  std::string text;
  try {
    text = payload->at("candidates").at(0).at("content").at("parts").at(0).at("text")
               .get<std::string>();
  } catch (const json::exception& e) {
    std::cerr << "[GeminiVisionProvider] unexpected response shape: " << e.what() << "\n";
    return std::unexpected(core::make_error(core::ErrorCode::ProviderFailed,
                                            "Gemini response has no candidate text"));
  }

  auto reply = extract_json_object(text);
  if (!reply) {
    return std::unexpected(reply.error());
  }
  return detection_from_reply(*reply);
}

}  // namespace cropsight::detection
