#pragma once

#include <cropsight/core/error.hpp>
#include <cropsight/enrichment/knowledge_provider.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <expected>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>

namespace cropsight::enrichment {

/// Static disease database: a JSON object mapping class names to disease records.
///
/// Lookup normalizes spaces and dashes to underscores and ignores case; when there is no
/// exact match, the first entry whose name contains the label (or is contained in it)
/// wins. NotFound if nothing matches.
class KnowledgeBaseProvider : public IKnowledgeProvider {
 private:
  struct PrivateTag {
    explicit PrivateTag() = default;
  };

 public:
  /// Use from_json() or from_file().
  explicit KnowledgeBaseProvider(PrivateTag) {}

  /// InvalidConfig if `database` is not an object.
  [[nodiscard]] static std::expected<std::shared_ptr<KnowledgeBaseProvider>, core::Error>
  from_json(const nlohmann::json& database);

  /// NotFound if the file cannot be opened, InvalidConfig if it is not a JSON object.
  [[nodiscard]] static std::expected<std::shared_ptr<KnowledgeBaseProvider>, core::Error>
  from_file(const std::string& path);

  [[nodiscard]] std::string id() const override { return "knowledge-base"; }

  [[nodiscard]] std::expected<Knowledge, core::Error> generate_knowledge(
      const std::string& label, float confidence, std::stop_token stop) override;

  /// Key of the record the label resolves to, if any.
  [[nodiscard]] std::optional<std::string> resolve(const std::string& label) const;

  [[nodiscard]] std::size_t size() const noexcept { return records_.size(); }

 private:
  /// normalized key -> (original key, record)
  std::map<std::string, std::pair<std::string, Knowledge>> records_;
};

}  // namespace cropsight::enrichment
