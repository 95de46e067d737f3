#include <cropsight/app/config.hpp>
#include <cropsight/app/detection_service.hpp>
#include <cropsight/app/service_builder.hpp>
#include <cropsight/core/detection_result.hpp>
#include <cropsight/core/error.hpp>
#include <cropsight/core/image.hpp>
#include <cropsight/detection/local_prototype_provider.hpp>
#include <cropsight/detection/mock_detection_provider.hpp>
#include <cropsight/enrichment/enrichment_gate.hpp>
#include <cropsight/enrichment/knowledge_base_provider.hpp>
#include <cropsight/fewshot/prototype_store.hpp>
#include <cropsight/vision/mock_embedding_generator.hpp>
#include "support/test_helpers.hpp"
#include <nlohmann/json.hpp>
#include <gtest/gtest.h>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using namespace cropsight::app;
using namespace cropsight::core;
namespace nd = cropsight::detection;
namespace ne = cropsight::enrichment;
namespace nf = cropsight::fewshot;
namespace nv = cropsight::vision;
namespace t = cropsight::test;
using json = nlohmann::json;
using namespace std::chrono_literals;

constexpr std::size_t kDim = 8;

/// Exemplars whose embeddings cluster around basis vector `axis`.
std::vector<Image> exemplars(nv::MockEmbeddingGenerator& gen, const std::string& tag,
                             std::size_t axis, std::size_t n = 5) {
  std::vector<Image> images;
  for (std::size_t i = 0; i < n; ++i) {
    Image img = t::tagged_image(tag + "-" + std::to_string(i));
    Embedding e = t::basis(kDim, axis);
    e[(axis + 1 + i) % kDim] = 0.1f;
    gen.set_embedding(img, e);
    images.push_back(std::move(img));
  }
  return images;
}

struct LocalThenRemote {
  std::shared_ptr<nv::MockEmbeddingGenerator> generator =
      std::make_shared<nv::MockEmbeddingGenerator>(kDim);
  std::shared_ptr<nf::InMemoryPrototypeStore> store =
      std::make_shared<nf::InMemoryPrototypeStore>();
  std::shared_ptr<nd::MockDetectionProvider> remote =
      std::make_shared<nd::MockDetectionProvider>("gemini");
  std::unique_ptr<DetectionService> service;

  LocalThenRemote() {
    ServiceParts parts;
    parts.generator = generator;
    parts.store = store;
    parts.chain.add(std::make_shared<nd::LocalPrototypeProvider>(generator, store), 1000ms);
    parts.chain.add(remote, 1000ms);
    service = std::make_unique<DetectionService>(std::move(parts));
  }
};

std::string chat_envelope(const std::string& text) {
  json j = {{"choices", json::array({{{"message", {{"role", "assistant"}, {"content", text}}}}})}};
  return j.dump();
}

}  // namespace

TEST(DetectionService, LearnedClassIsRecognizedLocally) {
  LocalThenRemote f;
  auto aphid = f.service->learn("Aphid", exemplars(*f.generator, "aphid", 0));
  ASSERT_TRUE(aphid.has_value()) << aphid.error().message;
  EXPECT_EQ(aphid->sample_count, 5u);
  ASSERT_TRUE(f.service->learn("Thrips", exemplars(*f.generator, "thrips", 3)).has_value());

  Image query = t::tagged_image("field-photo");
  Embedding q = t::basis(kDim, 3);
  q[0] = 0.2f;
  f.generator->set_embedding(query, q);

  auto first = f.service->classify(query);
  ASSERT_TRUE(first.has_value()) << first.error().message;
  EXPECT_EQ(first->label, "Thrips");
  EXPECT_EQ(first->provenance, "local-prototype");
  EXPECT_GT(first->confidence, 0.9f);
  EXPECT_EQ(first->risk_level, risk_level_from_confidence(first->confidence));
  EXPECT_EQ(f.remote->calls(), 0u);

  auto second = f.service->classify(query);
  ASSERT_TRUE(second.has_value());
  EXPECT_EQ(second->label, first->label);
  EXPECT_FLOAT_EQ(second->confidence, first->confidence);
}

TEST(DetectionService, EmptyStoreFallsBackToRemoteProvider) {
  LocalThenRemote f;
  DetectionResult remote_result;
  remote_result.label = "Late Blight";
  remote_result.confidence = 0.83f;
  remote_result.risk_level = RiskLevel::High;
  f.remote->set_result(remote_result);

  std::vector<std::string> attempted;
  nd::AttemptCallback cb = [&attempted](const nd::AttemptInfo& a) {
    attempted.push_back(a.provider_id);
  };
  auto r = f.service->classify(t::tagged_image("leaf"), &cb);
  ASSERT_TRUE(r.has_value()) << r.error().message;
  EXPECT_EQ(r->label, "Late Blight");
  EXPECT_EQ(r->provenance, "gemini");
  EXPECT_EQ(attempted, (std::vector<std::string>{"local-prototype", "gemini"}));
  EXPECT_EQ(f.generator->calls(), 0u);
}

TEST(DetectionService, EveryProviderFailingIsReportedWithReasons) {
  LocalThenRemote f;
  f.remote->set_error(make_error(ErrorCode::ProviderFailed, "HTTP 503"));

  auto r = f.service->classify(t::tagged_image("leaf"));
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, ErrorCode::AllProvidersFailed);
  ASSERT_EQ(r.error().provider_failures.size(), 2u);
  EXPECT_EQ(r.error().provider_failures[0].code, ErrorCode::NoPrototypes);
  EXPECT_EQ(r.error().provider_failures[1].reason, "HTTP 503");
}

TEST(DetectionService, EmptyImageIsInvalidInput) {
  LocalThenRemote f;
  auto r = f.service->classify(Image{});
  ASSERT_FALSE(r.has_value());
  EXPECT_EQ(r.error().code, ErrorCode::InvalidInput);
  EXPECT_EQ(f.remote->calls(), 0u);
}

TEST(DetectionService, LearnRejectsBadCountsAndDuplicates) {
  LocalThenRemote f;
  auto too_few = f.service->learn("Aphid", exemplars(*f.generator, "few", 0, 4));
  ASSERT_FALSE(too_few.has_value());
  EXPECT_EQ(too_few.error().code, ErrorCode::Validation);
  EXPECT_EQ(f.generator->calls(), 0u);

  ASSERT_TRUE(f.service->learn("Aphid", exemplars(*f.generator, "a", 0)).has_value());
  auto again = f.service->learn("APHID", exemplars(*f.generator, "b", 1));
  ASSERT_FALSE(again.has_value());
  EXPECT_EQ(again.error().code, ErrorCode::DuplicateClass);
  EXPECT_EQ(f.service->list_prototypes().size(), 1u);
}

TEST(DetectionService, HealthReflectsComponents) {
  LocalThenRemote f;
  ASSERT_TRUE(f.service->learn("Aphid", exemplars(*f.generator, "aphid", 0)).has_value());
  const auto h = f.service->health();
  EXPECT_EQ(h.embedding_backend, "mock");
  EXPECT_TRUE(h.embedding_ready);
  EXPECT_EQ(h.embedding_dim, kDim);
  EXPECT_EQ(h.known_classes, 1u);
  EXPECT_EQ(h.providers, (std::vector<std::string>{"local-prototype", "gemini"}));
  EXPECT_FALSE(h.enrichment_enabled);
}

TEST(DetectionService, ListIsSortedCaseInsensitively) {
  LocalThenRemote f;
  ASSERT_TRUE(f.service->learn("whitefly", exemplars(*f.generator, "w", 0)).has_value());
  ASSERT_TRUE(f.service->learn("Aphid", exemplars(*f.generator, "a", 1)).has_value());
  ASSERT_TRUE(f.service->learn("Mealybug", exemplars(*f.generator, "m", 2)).has_value());
  const auto list = f.service->list_prototypes();
  ASSERT_EQ(list.size(), 3u);
  EXPECT_EQ(list[0].label, "Aphid");
  EXPECT_EQ(list[1].label, "Mealybug");
  EXPECT_EQ(list[2].label, "whitefly");
}

TEST(BuildService, LearnedPrototypesSurviveRestart) {
  const auto path = std::filesystem::temp_directory_path() / "cropsight_service_prototypes.json";
  std::filesystem::remove(path);

  ServiceConfig cfg = default_config();
  cfg.embedding_dim = kDim;
  cfg.provider_order = {"local"};
  cfg.prototypes_path = path.string();
  auto transport = std::make_shared<t::FakeHttpTransport>();
  auto generator = std::make_shared<nv::MockEmbeddingGenerator>(kDim);

  {
    auto service = build_service(cfg, generator, transport);
    ASSERT_TRUE(service->learn("Spider Mite", exemplars(*generator, "mite", 2)).has_value());
  }
  ASSERT_TRUE(std::filesystem::exists(path));

  auto restarted = build_service(cfg, generator, transport);
  const auto list = restarted->list_prototypes();
  ASSERT_EQ(list.size(), 1u);
  EXPECT_EQ(list[0].label, "Spider Mite");
  EXPECT_EQ(list[0].vector.size(), kDim);

  Image query = t::tagged_image("mite-query");
  generator->set_embedding(query, t::basis(kDim, 2));
  auto r = restarted->classify(query);
  ASSERT_TRUE(r.has_value()) << r.error().message;
  EXPECT_EQ(r->label, "Spider Mite");
  EXPECT_TRUE(transport->requests().empty());

  std::filesystem::remove(path);
}

TEST(BuildService, RemoteReplyIsEnrichedFromKnowledgeBase) {
  const auto kb_path = std::filesystem::temp_directory_path() / "cropsight_service_kb.json";
  {
    std::ofstream out(kb_path);
    out << json{{"Corn_Common_Rust",
                 {{"symptoms", json::array({"Cinnamon-brown pustules"})},
                  {"treatment", {{"chemical_control", json::array({"Azoxystrobin"})}}},
                  {"prevention", json::array({"Plant resistant hybrids"})}}}}
               .dump();
  }

  ServiceConfig cfg = default_config();
  cfg.embedding_dim = kDim;
  cfg.provider_order = {"local", "groq"};
  cfg.groq_api_key = "q-key";
  cfg.knowledge_provider = KnowledgeProviderType::KnowledgeBase;
  cfg.knowledge_base_path = kb_path.string();

  auto transport = std::make_shared<t::FakeHttpTransport>();
  transport->push(200, chat_envelope(R"({"disease_name": "Common Rust", "confidence": 0.55})"));
  auto service =
      build_service(cfg, std::make_shared<nv::MockEmbeddingGenerator>(kDim), transport);
  std::filesystem::remove(kb_path);

  auto r = service->classify(t::tagged_image("corn-leaf"));
  ASSERT_TRUE(r.has_value()) << r.error().message;
  EXPECT_EQ(r->label, "Common Rust");
  EXPECT_EQ(r->provenance, "groq");
  EXPECT_NEAR(r->confidence, 0.55f, 1e-5f);
  EXPECT_EQ(r->risk_level, RiskLevel::Low);
  EXPECT_TRUE(r->enriched);
  ASSERT_TRUE(r->symptoms.has_value());
  EXPECT_EQ(r->symptoms->front(), "Cinnamon-brown pustules");
  ASSERT_TRUE(r->treatment.has_value());
  EXPECT_EQ(r->treatment->chemical_control.front(), "Azoxystrobin");
  EXPECT_TRUE(service->health().enrichment_enabled);
}

TEST(BuildService, UnknownProviderNameThrows) {
  ServiceConfig cfg = default_config();
  cfg.provider_order = {"local", "claude"};
  auto transport = std::make_shared<t::FakeHttpTransport>();
  EXPECT_THROW((void)build_service(cfg, std::make_shared<nv::MockEmbeddingGenerator>(8), transport),
               std::invalid_argument);
}

TEST(BuildService, OnnxWithoutModelPathThrows) {
  ServiceConfig cfg = default_config();
  cfg.embedding_backend = EmbeddingBackendType::Onnx;
  cfg.model_path.clear();
  EXPECT_THROW((void)make_embedding_generator(cfg), std::runtime_error);
}
