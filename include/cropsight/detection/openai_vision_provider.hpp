#pragma once

#include <cropsight/core/detection_result.hpp>
#include <cropsight/core/error.hpp>
#include <cropsight/core/image.hpp>
#include <cropsight/detection/detection_provider.hpp>
#include <cropsight/detection/http_transport.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <stop_token>
#include <string>

namespace cropsight::detection {

/// Endpoint and model of an OpenAI-compatible chat/completions vision API.
struct OpenAiVisionConfig {
  std::string id;  // provenance, e.g. "groq"
  std::string api_key;
  std::string base_url;
  std::string path{"/v1/chat/completions"};
  std::string model;
  float temperature{0.3f};
  int max_tokens{1000};
  std::chrono::milliseconds request_timeout{30000};
};

[[nodiscard]] OpenAiVisionConfig groq_vision_config(std::string api_key);
[[nodiscard]] OpenAiVisionConfig openai_vision_config(std::string api_key);

/// chat/completions with the image as an image_url data URI (Groq, OpenAI and
/// compatible servers). The reply text is parsed with detection_from_reply().
class OpenAiCompatibleVisionProvider : public IDetectionProvider {
 public:
  OpenAiCompatibleVisionProvider(std::shared_ptr<IHttpTransport> transport,
                                 OpenAiVisionConfig cfg);

  [[nodiscard]] std::string id() const override { return cfg_.id; }

  [[nodiscard]] std::expected<core::DetectionResult, core::Error> detect(
      const core::Image& image, std::stop_token stop) override;

 private:
  std::shared_ptr<IHttpTransport> transport_;
  OpenAiVisionConfig cfg_;
};

}  // namespace cropsight::detection
