#include <cropsight/core/error.hpp>
#include <cropsight/enrichment/knowledge_base_provider.hpp>
#include <cropsight/enrichment/llm_knowledge_provider.hpp>
#include "support/test_helpers.hpp"
#include <nlohmann/json.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <stop_token>
#include <string>

namespace ne = cropsight::enrichment;
namespace nc = cropsight::core;
namespace t = cropsight::test;
using json = nlohmann::json;

namespace {

json sample_database() {
  return json{
      {"Tomato_Early_Blight",
       {{"plant", "Tomato"},
        {"pathogen_name", "Alternaria solani"},
        {"symptoms", {"Concentric rings", "Yellow halo"}},
        {"treatment", {{"chemical_control", json::array({"Chlorothalonil"})}}},
        {"prevention", json::array({"Rotate crops"})}}},
      {"Potato Late Blight",
       {{"plant", "Potato"},
        {"symptoms", json::array({"Water-soaked lesions"})},
        {"prevention", json::array({"Certified seed"})}}},
  };
}

std::shared_ptr<ne::KnowledgeBaseProvider> make_kb() {
  auto kb = ne::KnowledgeBaseProvider::from_json(sample_database());
  if (!kb) throw std::runtime_error(kb.error().message);
  return *kb;
}

std::string chat_envelope(const std::string& text) {
  json j = {{"choices", json::array({{{"message", {{"role", "assistant"}, {"content", text}}}}})}};
  return j.dump();
}

}  // namespace

TEST(KnowledgeBaseProvider, ExactMatchIgnoresCaseSpacesAndDashes) {
  auto kb = make_kb();
  EXPECT_EQ(kb->size(), 2u);
  EXPECT_EQ(kb->resolve("tomato early-blight").value_or(""), "Tomato_Early_Blight");
  EXPECT_EQ(kb->resolve("POTATO_LATE_BLIGHT").value_or(""), "Potato Late Blight");

  auto k = kb->generate_knowledge("Tomato Early Blight", 0.4f, std::stop_token{});
  ASSERT_TRUE(k.has_value()) << k.error().message;
  EXPECT_EQ(k->plant.value_or(""), "Tomato");
  EXPECT_EQ(k->pathogen.value_or(""), "Alternaria solani");
  ASSERT_EQ(k->symptoms.size(), 2u);
  EXPECT_EQ(k->treatment.chemical_control.front(), "Chlorothalonil");
}

TEST(KnowledgeBaseProvider, SubstringMatchInEitherDirection) {
  auto kb = make_kb();
  EXPECT_EQ(kb->resolve("Late Blight").value_or(""), "Potato Late Blight");
  EXPECT_EQ(kb->resolve("tomato_early_blight_leaf").value_or(""), "Tomato_Early_Blight");
}

TEST(KnowledgeBaseProvider, UnknownLabelIsNotFound) {
  auto kb = make_kb();
  auto k = kb->generate_knowledge("Citrus Canker", 0.5f, std::stop_token{});
  ASSERT_FALSE(k.has_value());
  EXPECT_EQ(k.error().code, nc::ErrorCode::NotFound);
  EXPECT_FALSE(kb->resolve("").has_value());
}

TEST(KnowledgeBaseProvider, NonObjectDatabaseIsInvalidConfig) {
  auto kb = ne::KnowledgeBaseProvider::from_json(json::array({"a", "b"}));
  ASSERT_FALSE(kb.has_value());
  EXPECT_EQ(kb.error().code, nc::ErrorCode::InvalidConfig);
}

TEST(KnowledgeBaseProvider, LoadsFromFile) {
  const auto path = std::filesystem::temp_directory_path() / "cropsight_kb_test.json";
  {
    std::ofstream out(path);
    out << sample_database().dump(2);
  }
  auto kb = ne::KnowledgeBaseProvider::from_file(path.string());
  std::filesystem::remove(path);
  ASSERT_TRUE(kb.has_value()) << kb.error().message;
  EXPECT_EQ((*kb)->size(), 2u);

  auto missing = ne::KnowledgeBaseProvider::from_file("/nonexistent/cropsight/kb.json");
  ASSERT_FALSE(missing.has_value());
  EXPECT_EQ(missing.error().code, nc::ErrorCode::NotFound);
}

TEST(KnowledgeBaseProvider, MalformedFileIsInvalidConfig) {
  const auto path = std::filesystem::temp_directory_path() / "cropsight_kb_bad.json";
  {
    std::ofstream out(path);
    out << "{ \"Rust\": ";
  }
  auto kb = ne::KnowledgeBaseProvider::from_file(path.string());
  std::filesystem::remove(path);
  ASSERT_FALSE(kb.has_value());
  EXPECT_EQ(kb.error().code, nc::ErrorCode::InvalidConfig);
}

TEST(LlmKnowledgeProvider, RequestsJsonObjectAndParsesRecord) {
  auto transport = std::make_shared<t::FakeHttpTransport>();
  const json record = {
      {"disease_name", "Leaf Rust"},
      {"symptoms", json::array({"Orange pustules"})},
      {"treatment", {{"organic_control", json::array({"Sulfur dust"})}}},
      {"prevention", json::array({"Resistant cultivars"})},
      {"prognosis", "Yield loss if untreated"},
      {"spread_risk", "High in humid weather"},
  };
  transport->push(200, chat_envelope(record.dump()));
  ne::LlmKnowledgeConfig cfg;
  cfg.api_key = "c-key";
  ne::LlmKnowledgeProvider provider(transport, cfg);

  auto k = provider.generate_knowledge("Leaf Rust", 0.42f, std::stop_token{});
  ASSERT_TRUE(k.has_value()) << k.error().message;
  EXPECT_EQ(k->symptoms.front(), "Orange pustules");
  EXPECT_EQ(k->treatment.organic_control.front(), "Sulfur dust");
  EXPECT_EQ(k->spread_risk.value_or(""), "High in humid weather");

  const auto req = transport->requests().front();
  EXPECT_EQ(req.base_url, "https://api.cerebras.ai");
  EXPECT_EQ(req.path, "/v1/chat/completions");
  const json body = json::parse(req.body);
  EXPECT_EQ(body["response_format"]["type"], "json_object");
  EXPECT_EQ(body["messages"].size(), 2u);
  EXPECT_NE(body["messages"][1]["content"].get<std::string>().find("Leaf Rust"), std::string::npos);
}

TEST(LlmKnowledgeProvider, FailuresAreEnrichmentFailed) {
  ne::LlmKnowledgeConfig cfg;
  cfg.api_key = "c-key";

  auto http_error = std::make_shared<t::FakeHttpTransport>();
  http_error->push(500, "internal");
  auto a = ne::LlmKnowledgeProvider(http_error, cfg).generate_knowledge("Rust", 0.3f, {});
  ASSERT_FALSE(a.has_value());
  EXPECT_EQ(a.error().code, nc::ErrorCode::EnrichmentFailed);
  EXPECT_EQ(a.error().message.rfind("cerebras: ", 0), 0u);

  auto empty_record = std::make_shared<t::FakeHttpTransport>();
  empty_record->push(200, chat_envelope("{\"unrelated\": 1}"));
  auto b = ne::LlmKnowledgeProvider(empty_record, cfg).generate_knowledge("Rust", 0.3f, {});
  ASSERT_FALSE(b.has_value());
  EXPECT_EQ(b.error().code, nc::ErrorCode::EnrichmentFailed);

  auto unused = std::make_shared<t::FakeHttpTransport>();
  auto c = ne::LlmKnowledgeProvider(unused, ne::LlmKnowledgeConfig{})
               .generate_knowledge("Rust", 0.3f, {});
  ASSERT_FALSE(c.has_value());
  EXPECT_EQ(c.error().code, nc::ErrorCode::EnrichmentFailed);
  EXPECT_TRUE(unused->requests().empty());
}
