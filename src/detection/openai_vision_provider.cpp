#include <cropsight/detection/openai_vision_provider.hpp>
#include <cropsight/detection/reply_parsing.hpp>
#include <cropsight/detection/vision_prompt.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace cropsight::detection {

using json = nlohmann::json;

OpenAiVisionConfig groq_vision_config(std::string api_key) {
  OpenAiVisionConfig c;
  c.id = "groq";
  c.api_key = std::move(api_key);
  c.base_url = "https://api.groq.com";
  c.path = "/openai/v1/chat/completions";
  c.model = "meta-llama/llama-4-scout-17b-16e-instruct";
  return c;
}

OpenAiVisionConfig openai_vision_config(std::string api_key) {
  OpenAiVisionConfig c;
  c.id = "openai";
  c.api_key = std::move(api_key);
  c.base_url = "https://api.openai.com";
  c.path = "/v1/chat/completions";
  c.model = "gpt-4o";
  return c;
}

OpenAiCompatibleVisionProvider::OpenAiCompatibleVisionProvider(
    std::shared_ptr<IHttpTransport> transport, OpenAiVisionConfig cfg)
    : transport_(std::move(transport)), cfg_(std::move(cfg)) {
  if (!transport_) {
    throw std::invalid_argument("OpenAiCompatibleVisionProvider: transport is required");
  }
  if (cfg_.id.empty()) {
    throw std::invalid_argument("OpenAiCompatibleVisionProvider: id is required");
  }
}

std::expected<core::DetectionResult, core::Error> OpenAiCompatibleVisionProvider::detect(
    const core::Image& image, std::stop_token stop) {
  if (cfg_.api_key.empty()) {
    return std::unexpected(core::make_error(core::ErrorCode::ProviderFailed,
                                            cfg_.id + ": API key is not set"));
  }
  if (image.empty()) {
    return std::unexpected(core::make_error(core::ErrorCode::InvalidInput, "empty image"));
  }

  const std::string data_uri = "data:" + image.mime_type() + ";base64," + image.to_base64();
  json content = json::array({
      {{"type", "text"}, {"text", std::string(kVisionPrompt)}},
      {{"type", "image_url"}, {"image_url", {{"url", data_uri}}}},
  });
  json body = {
      {"model", cfg_.model},
      {"messages", json::array({{{"role", "user"}, {"content", content}}})},
      {"temperature", cfg_.temperature},
      {"max_tokens", cfg_.max_tokens},
  };

  HttpRequest req;
  req.base_url = cfg_.base_url;
  req.path = cfg_.path;
  req.headers = {{"Authorization", "Bearer " + cfg_.api_key}};
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
    text = payload->at("choices").at(0).at("message").at("content").get<std::string>();
  } catch (const json::exception& e) {
    std::cerr << "[OpenAiCompatibleVisionProvider] " << cfg_.id
              << ": unexpected response shape: " << e.what() << "\n";
    return std::unexpected(core::make_error(core::ErrorCode::ProviderFailed,
                                            cfg_.id + " response has no message content"));
  }

  auto reply = extract_json_object(text);
  if (!reply) {
    return std::unexpected(reply.error());
  }
  return detection_from_reply(*reply);
}

}  // namespace cropsight::detection
