#include <cropsight/enrichment/knowledge_base_provider.hpp>
#include <cctype>
#include <fstream>
#include <memory>
#include <utility>

namespace cropsight::enrichment {

using json = nlohmann::json;

namespace {

std::string normalize(const std::string& name) {
  std::string out;
  out.reserve(name.size());
  for (unsigned char c : name) {
    if (c == ' ' || c == '-') {
      out.push_back('_');
    } else {
      out.push_back(static_cast<char>(std::tolower(c)));
    }
  }
  return out;
}

}  // namespace

std::expected<std::shared_ptr<KnowledgeBaseProvider>, core::Error> KnowledgeBaseProvider::from_json(
    const json& database) {
  if (!database.is_object()) {
    return std::unexpected(core::make_error(core::ErrorCode::InvalidConfig,
                                            "knowledge base must be a JSON object"));
  }
  auto kb = std::make_shared<KnowledgeBaseProvider>(PrivateTag{});
  for (const auto& [name, record] : database.items()) {
    kb->records_.emplace(normalize(name), std::make_pair(name, knowledge_from_json(record)));
  }
  return kb;
}

std::expected<std::shared_ptr<KnowledgeBaseProvider>, core::Error> KnowledgeBaseProvider::from_file(
    const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    return std::unexpected(
        core::make_error(core::ErrorCode::NotFound, "cannot open knowledge base " + path));
  }
  try {
    return from_json(json::parse(f));
  } catch (const json::parse_error& e) {
    return std::unexpected(core::make_error(core::ErrorCode::InvalidConfig,
                                            path + ": " + e.what()));
  }
}

std::optional<std::string> KnowledgeBaseProvider::resolve(const std::string& label) const {
  const std::string key = normalize(label);
  if (key.empty()) return std::nullopt;
  if (auto it = records_.find(key); it != records_.end()) {
    return it->second.first;
  }
  for (const auto& [normalized, entry] : records_) {
    if (normalized.find(key) != std::string::npos || key.find(normalized) != std::string::npos) {
      return entry.first;
    }
  }
  return std::nullopt;
}

std::expected<Knowledge, core::Error> KnowledgeBaseProvider::generate_knowledge(
    const std::string& label, float /*confidence*/, std::stop_token /*stop*/) {
  auto name = resolve(label);
  if (!name) {
    return std::unexpected(
        core::make_error(core::ErrorCode::NotFound, "no knowledge base entry for '" + label + "'"));
  }
  return records_.at(normalize(*name)).second;
}

}  // namespace cropsight::enrichment
