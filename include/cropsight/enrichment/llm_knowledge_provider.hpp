#pragma once

#include <cropsight/core/error.hpp>
#include <cropsight/detection/http_transport.hpp>
#include <cropsight/enrichment/knowledge_provider.hpp>
#include <chrono>
#include <expected>
#include <memory>
#include <stop_token>
#include <string>

namespace cropsight::enrichment {

struct LlmKnowledgeConfig {
  std::string id{"cerebras"};
  std::string api_key;
  std::string base_url{"https://api.cerebras.ai"};
  std::string path{"/v1/chat/completions"};
  std::string model{"qwen-3-235b-a22b-instruct-2507"};
  float temperature{0.2f};
  int max_tokens{1200};
  std::chrono::milliseconds request_timeout{8000};
};

/// Text-only OpenAI-compatible chat/completions model asked for a disease record in
/// JSON (response_format json_object). Cerebras by default.
class LlmKnowledgeProvider : public IKnowledgeProvider {
 public:
  LlmKnowledgeProvider(std::shared_ptr<detection::IHttpTransport> transport,
                       LlmKnowledgeConfig cfg);

  [[nodiscard]] std::string id() const override { return cfg_.id; }

  [[nodiscard]] std::expected<Knowledge, core::Error> generate_knowledge(
      const std::string& label, float confidence, std::stop_token stop) override;

 private:
  std::shared_ptr<detection::IHttpTransport> transport_;
  LlmKnowledgeConfig cfg_;
};

}  // namespace cropsight::enrichment
