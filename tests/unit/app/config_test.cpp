#include <cropsight/app/config.hpp>
#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace na = cropsight::app;

namespace {

/// Writes `content` to a temp file, removed when the object goes out of scope.
struct TempConfig {
  std::filesystem::path path;
  explicit TempConfig(const std::string& content, const std::string& name = "cropsight_test.conf")
      : path(std::filesystem::temp_directory_path() / name) {
    std::ofstream out(path);
    out << content;
  }
  ~TempConfig() { std::filesystem::remove(path); }
};

}  // namespace

TEST(Config, DefaultsUseMockBackendAndLocalFirst) {
  const auto c = na::default_config();
  EXPECT_EQ(c.embedding_backend, na::EmbeddingBackendType::Mock);
  EXPECT_EQ(c.embedding_dim, 512u);
  EXPECT_EQ(c.provider_order, (std::vector<std::string>{"local", "gemini", "groq"}));
  EXPECT_EQ(c.knowledge_provider, na::KnowledgeProviderType::None);
  EXPECT_FLOAT_EQ(c.enrichment_threshold, 0.65f);
  EXPECT_EQ(c.min_exemplars, 5u);
  EXPECT_EQ(c.max_exemplars, 10u);
}

TEST(Config, MissingFileGivesDefaults) {
  const auto c = na::load_config("/nonexistent/cropsight/service.conf");
  EXPECT_EQ(c.embedding_backend, na::EmbeddingBackendType::Mock);
  EXPECT_EQ(c.provider_order.size(), 3u);
}

TEST(Config, ParsesKeyValueFile) {
  TempConfig file(
      "# cropsight service\n"
      "embedding_backend = onnx\n"
      "model_path=/models/clip_vit_b32.onnx\n"
      "embedding_dim=768\n"
      "normalize_mean_r=0.5\n"
      "\n"
      "provider_order = gemini, local ,openai\n"
      "gemini_timeout_ms=12000\n"
      "knowledge_provider=knowledge_base\n"
      "knowledge_base_path=data/diseases.json\n"
      "enrichment_threshold=0.7\n"
      "max_exemplars=8\n"
      "unknown_key=ignored\n"
      "not a key value line\n");
  const auto c = na::load_config(file.path.string());
  EXPECT_EQ(c.embedding_backend, na::EmbeddingBackendType::Onnx);
  EXPECT_EQ(c.model_path, "/models/clip_vit_b32.onnx");
  EXPECT_EQ(c.embedding_dim, 768u);
  EXPECT_FLOAT_EQ(c.normalize_mean[0], 0.5f);
  EXPECT_FLOAT_EQ(c.normalize_mean[1], 0.456f);
  EXPECT_EQ(c.provider_order, (std::vector<std::string>{"gemini", "local", "openai"}));
  EXPECT_EQ(c.gemini_timeout_ms, 12000u);
  EXPECT_EQ(c.groq_timeout_ms, 30000u);
  EXPECT_EQ(c.knowledge_provider, na::KnowledgeProviderType::KnowledgeBase);
  EXPECT_EQ(c.knowledge_base_path, "data/diseases.json");
  EXPECT_FLOAT_EQ(c.enrichment_threshold, 0.7f);
  EXPECT_EQ(c.max_exemplars, 8u);
}

TEST(Config, MalformedNumberThrows) {
  TempConfig file("embedding_dim=512px\n");
  EXPECT_THROW((void)na::load_config(file.path.string()), std::invalid_argument);
}

TEST(Config, NegativeTimeoutThrows) {
  TempConfig file("local_timeout_ms=-5\n");
  EXPECT_THROW((void)na::load_config(file.path.string()), std::invalid_argument);
}

TEST(Config, NonFiniteOrOutOfRangeFractionThrows) {
  TempConfig nan_threshold("enrichment_threshold=nan\n", "cropsight_nan.conf");
  EXPECT_THROW((void)na::load_config(nan_threshold.path.string()), std::invalid_argument);
  TempConfig high_threshold("enrichment_threshold=1.5\n", "cropsight_high.conf");
  EXPECT_THROW((void)na::load_config(high_threshold.path.string()), std::invalid_argument);
  TempConfig inf_epsilon("tie_epsilon=inf\n", "cropsight_inf.conf");
  EXPECT_THROW((void)na::load_config(inf_epsilon.path.string()), std::invalid_argument);
  TempConfig negative_epsilon("tie_epsilon=-0.001\n", "cropsight_neg.conf");
  EXPECT_THROW((void)na::load_config(negative_epsilon.path.string()), std::invalid_argument);
}

TEST(Config, UnknownEnumValueThrows) {
  TempConfig backend("embedding_backend=tensorflow\n", "cropsight_backend.conf");
  EXPECT_THROW((void)na::load_config(backend.path.string()), std::invalid_argument);
  TempConfig knowledge("knowledge_provider=wikipedia\n", "cropsight_knowledge.conf");
  EXPECT_THROW((void)na::load_config(knowledge.path.string()), std::invalid_argument);
}

TEST(Config, EnvironmentSuppliesKeysAndModelPath) {
  ::setenv("GEMINI_API_KEY", "env-gemini", 1);
  ::setenv("CEREBRAS_API_KEY", "env-cerebras", 1);
  ::setenv("CROPSIGHT_MODEL_PATH", "/env/model.onnx", 1);
  ::unsetenv("GROQ_API_KEY");

  na::ServiceConfig c = na::default_config();
  c.groq_api_key = "from-file";
  na::apply_env_overrides(c);

  EXPECT_EQ(c.gemini_api_key, "env-gemini");
  EXPECT_EQ(c.cerebras_api_key, "env-cerebras");
  EXPECT_EQ(c.model_path, "/env/model.onnx");
  EXPECT_EQ(c.groq_api_key, "from-file");

  ::unsetenv("GEMINI_API_KEY");
  ::unsetenv("CEREBRAS_API_KEY");
  ::unsetenv("CROPSIGHT_MODEL_PATH");
}
