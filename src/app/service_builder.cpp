#include <cropsight/app/service_builder.hpp>
#include <cropsight/app/prototype_io.hpp>
#include <cropsight/core/error.hpp>
#include <cropsight/detection/gemini_vision_provider.hpp>
#include <cropsight/detection/local_prototype_provider.hpp>
#include <cropsight/detection/openai_vision_provider.hpp>
#include <cropsight/enrichment/knowledge_base_provider.hpp>
#include <cropsight/enrichment/llm_knowledge_provider.hpp>
#include <cropsight/fewshot/prototype_classifier.hpp>
#include <cropsight/vision/mock_embedding_generator.hpp>
#include <cropsight/vision/onnx_embedding_generator.hpp>
#include <cropsight/vision/preprocess_config.hpp>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace cropsight::app {

namespace {

using std::chrono::milliseconds;

vision::PreprocessConfig preprocess_config(const ServiceConfig& cfg) {
  vision::PreprocessConfig p;
  p.input_size = cfg.input_size;
  for (int c = 0; c < 3; ++c) {
    p.mean[c] = cfg.normalize_mean[c];
    p.stddev[c] = cfg.normalize_std[c];
  }
  p.max_image_bytes = cfg.max_image_bytes;
  return p;
}

std::shared_ptr<enrichment::IKnowledgeProvider> make_knowledge_provider(
    const ServiceConfig& cfg, const std::shared_ptr<detection::IHttpTransport>& transport) {
  switch (cfg.knowledge_provider) {
    case KnowledgeProviderType::None:
      return nullptr;
    case KnowledgeProviderType::KnowledgeBase: {
      auto kb = enrichment::KnowledgeBaseProvider::from_file(cfg.knowledge_base_path);
      if (!kb) {
        throw std::runtime_error("knowledge base: " + core::describe(kb.error()));
      }
      return *kb;
    }
    case KnowledgeProviderType::Cerebras: {
      enrichment::LlmKnowledgeConfig k;
      k.api_key = cfg.cerebras_api_key;
      k.request_timeout = milliseconds(cfg.enrichment_timeout_ms);
      return std::make_shared<enrichment::LlmKnowledgeProvider>(transport, std::move(k));
    }
  }
  return nullptr;
}

}  // namespace

std::shared_ptr<vision::IEmbeddingGenerator> make_embedding_generator(const ServiceConfig& cfg) {
  if (cfg.embedding_backend == EmbeddingBackendType::Onnx) {
    if (cfg.model_path.empty()) {
      throw std::runtime_error("embedding_backend=onnx requires model_path to be set in config");
    }
    auto onnx = std::make_shared<vision::OnnxEmbeddingGenerator>(
        cfg.model_path, preprocess_config(cfg), cfg.embedding_dim);
    onnx->warmup();
    return onnx;
  }
  return std::make_shared<vision::MockEmbeddingGenerator>(cfg.embedding_dim, cfg.max_image_bytes);
}

std::unique_ptr<DetectionService> build_service(
    const ServiceConfig& cfg, std::shared_ptr<detection::IHttpTransport> transport) {
  return build_service(cfg, make_embedding_generator(cfg), std::move(transport));
}

std::unique_ptr<DetectionService> build_service(
    const ServiceConfig& cfg,
    std::shared_ptr<vision::IEmbeddingGenerator> generator,
    std::shared_ptr<detection::IHttpTransport> transport) {
  if (!generator) {
    throw std::invalid_argument("build_service: embedding generator is required");
  }
  if (!transport) {
    transport = std::make_shared<detection::HttplibTransport>();
  }

  auto store = std::make_shared<fewshot::InMemoryPrototypeStore>();
  if (!cfg.prototypes_path.empty()) {
    auto loaded = load_into_store(cfg.prototypes_path, *store, generator->dimension());
    if (!loaded) {
      throw std::runtime_error("prototypes: " + core::describe(loaded.error()));
    }
    std::cerr << "[build_service] loaded " << *loaded << " prototypes from "
              << cfg.prototypes_path << "\n";
  }

  ServiceParts parts;
  parts.generator = generator;
  parts.store = store;

  for (const auto& name : cfg.provider_order) {
    if (name == "local") {
      parts.chain.add(std::make_shared<detection::LocalPrototypeProvider>(
                          generator, store, fewshot::PrototypeClassifier(cfg.tie_epsilon)),
                      milliseconds(cfg.local_timeout_ms));
    } else if (name == "gemini") {
      detection::GeminiConfig g;
      g.api_key = cfg.gemini_api_key;
      g.request_timeout = milliseconds(cfg.gemini_timeout_ms);
      parts.chain.add(std::make_shared<detection::GeminiVisionProvider>(transport, std::move(g)),
                      milliseconds(cfg.gemini_timeout_ms));
    } else if (name == "groq") {
      auto g = detection::groq_vision_config(cfg.groq_api_key);
      g.request_timeout = milliseconds(cfg.groq_timeout_ms);
      parts.chain.add(
          std::make_shared<detection::OpenAiCompatibleVisionProvider>(transport, std::move(g)),
          milliseconds(cfg.groq_timeout_ms));
    } else if (name == "openai") {
      auto o = detection::openai_vision_config(cfg.openai_api_key);
      o.request_timeout = milliseconds(cfg.openai_timeout_ms);
      parts.chain.add(
          std::make_shared<detection::OpenAiCompatibleVisionProvider>(transport, std::move(o)),
          milliseconds(cfg.openai_timeout_ms));
    } else {
      throw std::invalid_argument("provider_order: unknown provider '" + name +
                                  "' (use local, gemini, groq, openai)");
    }
  }

  enrichment::EnrichmentConfig ec;
  ec.threshold = cfg.enrichment_threshold;
  ec.timeout = milliseconds(cfg.enrichment_timeout_ms);
  parts.gate = enrichment::EnrichmentGate(make_knowledge_provider(cfg, transport), ec);

  parts.learning.min_exemplars = cfg.min_exemplars;
  parts.learning.max_exemplars = cfg.max_exemplars;
  parts.prototypes_path = cfg.prototypes_path;

  return std::make_unique<DetectionService>(std::move(parts));
}

}  // namespace cropsight::app
