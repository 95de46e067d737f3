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

struct GeminiConfig {
  std::string api_key;
  std::string model{"gemini-1.5-flash"};
  std::string base_url{"https://generativelanguage.googleapis.com"};
  float temperature{0.3f};
  int max_output_tokens{2000};
  std::chrono::milliseconds request_timeout{30000};
};

/// Gemini generateContent with the image sent as inline data. The model is asked for a
/// JSON object and the reply is parsed with detection_from_reply().
class GeminiVisionProvider : public IDetectionProvider {
 public:
  GeminiVisionProvider(std::shared_ptr<IHttpTransport> transport, GeminiConfig cfg);

  [[nodiscard]] std::string id() const override { return "gemini"; }

  [[nodiscard]] std::expected<core::DetectionResult, core::Error> detect(
      const core::Image& image, std::stop_token stop) override;

 private:
  std::shared_ptr<IHttpTransport> transport_;
  GeminiConfig cfg_;
};

}  // namespace cropsight::detection
