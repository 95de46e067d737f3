#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace cropsight::app {

/// Embedding backend type: mock (hash-seeded vectors) or onnx (real encoder).
enum class EmbeddingBackendType {
  Mock,
  Onnx,
};

enum class KnowledgeProviderType {
  None,
  KnowledgeBase,
  Cerebras,
};

/// Service configuration: embedding model, preprocessing, provider order and timeouts,
/// enrichment, learning limits, file locations, API keys.
struct ServiceConfig {
  EmbeddingBackendType embedding_backend{EmbeddingBackendType::Mock};
  std::string model_path;
  std::size_t embedding_dim{512};
  std::uint32_t input_size{224};
  float normalize_mean[3]{0.485f, 0.456f, 0.406f};
  float normalize_std[3]{0.229f, 0.224f, 0.225f};
  std::size_t max_image_bytes{10u * 1024u * 1024u};

  std::string prototypes_path;      // empty = in-memory only
  std::string knowledge_base_path;  // used by knowledge_provider=knowledge_base

  /// Detection providers in the order they are tried: local | gemini | groq | openai.
  std::vector<std::string> provider_order{"local", "gemini", "groq"};
  std::uint32_t local_timeout_ms{5000};
  std::uint32_t gemini_timeout_ms{30000};
  std::uint32_t groq_timeout_ms{30000};
  std::uint32_t openai_timeout_ms{30000};

  KnowledgeProviderType knowledge_provider{KnowledgeProviderType::None};
  float enrichment_threshold{0.65f};
  std::uint32_t enrichment_timeout_ms{8000};

  std::size_t min_exemplars{5};
  std::size_t max_exemplars{10};
  float tie_epsilon{1e-6f};

  // Secrets; normally set from the environment.
  std::string gemini_api_key;
  std::string groq_api_key;
  std::string openai_api_key;
  std::string cerebras_api_key;
};

/// Load config from a key=value file (one per line, '#' comments), starting from
/// default_config(). A missing file yields the defaults; unknown keys are ignored.
/// Throws std::invalid_argument for malformed numbers or unknown enum values.
ServiceConfig load_config(const std::string& path);

/// Default config when no file is provided: mock backend, local provider then Gemini
/// then Groq, no enrichment.
ServiceConfig default_config();

/// Fills API keys from GEMINI_API_KEY, GROQ_API_KEY, OPENAI_API_KEY, CEREBRAS_API_KEY and
/// model_path from CROPSIGHT_MODEL_PATH when those are set.
void apply_env_overrides(ServiceConfig& cfg);

}  // namespace cropsight::app
