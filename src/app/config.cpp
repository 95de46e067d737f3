#include <cropsight/app/config.hpp>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace cropsight::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

[[noreturn]] void bad_value(const std::string& key, const std::string& value) {
  throw std::invalid_argument("config: invalid value for " + key + ": '" + value + "'");
}

unsigned long parse_unsigned(const std::string& key, const std::string& value) {
  if (value.empty() || value[0] == '-') bad_value(key, value);
  try {
    std::size_t used = 0;
    const unsigned long v = std::stoul(value, &used);
    if (used != value.size()) bad_value(key, value);
    return v;
  } catch (const std::logic_error&) {
    bad_value(key, value);
  }
}

float parse_float(const std::string& key, const std::string& value) {
  try {
    std::size_t used = 0;
    const float v = std::stof(value, &used);
    if (used != value.size() || !std::isfinite(v)) bad_value(key, value);
    return v;
  } catch (const std::logic_error&) {
    bad_value(key, value);
  }
}

/// A float in [0, 1].
float parse_fraction(const std::string& key, const std::string& value) {
  const float v = parse_float(key, value);
  if (v < 0.f || v > 1.f) bad_value(key, value);
  return v;
}

std::vector<std::string> parse_list(const std::string& value) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= value.size()) {
    auto comma = value.find(',', start);
    if (comma == std::string::npos) comma = value.size();
    std::string item = value.substr(start, comma - start);
    trim(item);
    if (!item.empty()) out.push_back(item);
    start = comma + 1;
  }
  return out;
}

void set_from_env(std::string& field, const char* name) {
  const char* v = std::getenv(name);
  if (v && v[0] != '\0') field = v;
}

}  // namespace

ServiceConfig default_config() {
  ServiceConfig c;
  c.embedding_backend = EmbeddingBackendType::Mock;
  c.model_path = "";
  c.embedding_dim = 512;
  c.input_size = 224;
  c.provider_order = {"local", "gemini", "groq"};
  c.knowledge_provider = KnowledgeProviderType::None;
  c.enrichment_threshold = 0.65f;
  c.enrichment_timeout_ms = 8000;
  c.min_exemplars = 5;
  c.max_exemplars = 10;
  return c;
}

ServiceConfig load_config(const std::string& path) {
  ServiceConfig c = default_config();
  std::ifstream f(path);
  if (!f) return c;

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "embedding_backend") {
      if (value == "onnx") c.embedding_backend = EmbeddingBackendType::Onnx;
      else if (value == "mock") c.embedding_backend = EmbeddingBackendType::Mock;
      else bad_value(key, value);
    }
    else if (key == "model_path") c.model_path = value;
    else if (key == "embedding_dim") c.embedding_dim = parse_unsigned(key, value);
    else if (key == "input_size") c.input_size = static_cast<std::uint32_t>(parse_unsigned(key, value));
    else if (key == "normalize_mean_r") c.normalize_mean[0] = parse_float(key, value);
    else if (key == "normalize_mean_g") c.normalize_mean[1] = parse_float(key, value);
    else if (key == "normalize_mean_b") c.normalize_mean[2] = parse_float(key, value);
    else if (key == "normalize_std_r") c.normalize_std[0] = parse_float(key, value);
    else if (key == "normalize_std_g") c.normalize_std[1] = parse_float(key, value);
    else if (key == "normalize_std_b") c.normalize_std[2] = parse_float(key, value);
    else if (key == "max_image_bytes") c.max_image_bytes = parse_unsigned(key, value);
    else if (key == "prototypes_path") c.prototypes_path = value;
    else if (key == "knowledge_base_path") c.knowledge_base_path = value;
    else if (key == "provider_order") c.provider_order = parse_list(value);
    else if (key == "local_timeout_ms") c.local_timeout_ms = static_cast<std::uint32_t>(parse_unsigned(key, value));
    else if (key == "gemini_timeout_ms") c.gemini_timeout_ms = static_cast<std::uint32_t>(parse_unsigned(key, value));
    else if (key == "groq_timeout_ms") c.groq_timeout_ms = static_cast<std::uint32_t>(parse_unsigned(key, value));
    else if (key == "openai_timeout_ms") c.openai_timeout_ms = static_cast<std::uint32_t>(parse_unsigned(key, value));
    else if (key == "knowledge_provider") {
      if (value == "none") c.knowledge_provider = KnowledgeProviderType::None;
      else if (value == "knowledge_base") c.knowledge_provider = KnowledgeProviderType::KnowledgeBase;
      else if (value == "cerebras") c.knowledge_provider = KnowledgeProviderType::Cerebras;
      else bad_value(key, value);
    }
    else if (key == "enrichment_threshold") c.enrichment_threshold = parse_fraction(key, value);
    else if (key == "enrichment_timeout_ms") c.enrichment_timeout_ms = static_cast<std::uint32_t>(parse_unsigned(key, value));
    else if (key == "min_exemplars") c.min_exemplars = parse_unsigned(key, value);
    else if (key == "max_exemplars") c.max_exemplars = parse_unsigned(key, value);
    else if (key == "tie_epsilon") c.tie_epsilon = parse_fraction(key, value);
    else if (key == "gemini_api_key") c.gemini_api_key = value;
    else if (key == "groq_api_key") c.groq_api_key = value;
    else if (key == "openai_api_key") c.openai_api_key = value;
    else if (key == "cerebras_api_key") c.cerebras_api_key = value;
  }
  return c;
}

void apply_env_overrides(ServiceConfig& cfg) {
  set_from_env(cfg.gemini_api_key, "GEMINI_API_KEY");
  set_from_env(cfg.groq_api_key, "GROQ_API_KEY");
  set_from_env(cfg.openai_api_key, "OPENAI_API_KEY");
  set_from_env(cfg.cerebras_api_key, "CEREBRAS_API_KEY");
  set_from_env(cfg.model_path, "CROPSIGHT_MODEL_PATH");
}

}  // namespace cropsight::app
