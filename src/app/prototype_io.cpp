#include <cropsight/app/prototype_io.hpp>
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <system_error>

namespace cropsight::app {

using json = nlohmann::json;

namespace {

constexpr int kFormatVersion = 1;

std::int64_t to_unix_ms(std::chrono::system_clock::time_point t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

std::chrono::system_clock::time_point from_unix_ms(std::int64_t ms) {
  return std::chrono::system_clock::time_point(
      std::chrono::duration_cast<std::chrono::system_clock::duration>(
          std::chrono::milliseconds(ms)));
}

}  // namespace

std::expected<std::vector<core::Prototype>, core::Error> load_prototypes(const std::string& path) {
  std::vector<core::Prototype> out;
  std::ifstream f(path);
  if (!f) return out;

  try {
    const json doc = json::parse(f);
    for (const auto& item : doc.at("prototypes")) {
      core::Prototype p;
      p.label = item.at("label").get<std::string>();
      p.vector = item.at("vector").get<std::vector<float>>();
      p.sample_count = item.at("sample_count").get<std::uint32_t>();
      p.created_at = from_unix_ms(item.value("created_at_ms", std::int64_t{0}));
      p.estimated_accuracy = item.value("estimated_accuracy", 0.f);
      out.push_back(std::move(p));
    }
  } catch (const json::exception& e) {
    return std::unexpected(
        core::make_error(core::ErrorCode::InvalidConfig, path + ": " + e.what()));
  }
  return out;
}

std::expected<void, core::Error> save_prototypes(const std::string& path,
                                                 const std::vector<core::Prototype>& prototypes) {
  json list = json::array();
  for (const auto& p : prototypes) {
    list.push_back({
        {"label", p.label},
        {"vector", p.vector},
        {"sample_count", p.sample_count},
        {"created_at_ms", to_unix_ms(p.created_at)},
        {"estimated_accuracy", p.estimated_accuracy},
    });
  }
  const json doc = {{"version", kFormatVersion}, {"prototypes", std::move(list)}};

  const std::filesystem::path target(path);
  std::filesystem::path tmp = target;
  tmp += ".tmp";
  if (target.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(target.parent_path(), ec);
  }
  {
    std::ofstream f(tmp, std::ios::trunc);
    if (!f) {
      return std::unexpected(
          core::make_error(core::ErrorCode::InvalidConfig, "cannot write " + tmp.string()));
    }
    f << doc.dump(2);
    if (!f) {
      return std::unexpected(
          core::make_error(core::ErrorCode::InvalidConfig, "write failed: " + tmp.string()));
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, target, ec);
  if (ec) {
    return std::unexpected(core::make_error(core::ErrorCode::InvalidConfig,
                                            "cannot replace " + path + ": " + ec.message()));
  }
  return {};
}

std::expected<std::size_t, core::Error> load_into_store(const std::string& path,
                                                        fewshot::IPrototypeStore& store,
                                                        std::size_t dimension) {
  auto loaded = load_prototypes(path);
  if (!loaded) {
    return std::unexpected(loaded.error());
  }
  for (auto& p : *loaded) {
    if (p.vector.size() != dimension) {
      return std::unexpected(core::make_error(
          core::ErrorCode::DimensionMismatch,
          path + ": prototype '" + p.label + "' has " + std::to_string(p.vector.size()) +
              " values, embedding dimension is " + std::to_string(dimension)));
    }
    auto stored = store.put(std::move(p));
    if (!stored) {
      return std::unexpected(stored.error());
    }
  }
  return loaded->size();
}

}  // namespace cropsight::app
