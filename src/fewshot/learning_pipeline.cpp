#include <cropsight/fewshot/learning_pipeline.hpp>
#include <cropsight/core/embedding.hpp>
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace cropsight::fewshot {

namespace {

bool is_blank(const std::string& s) {
  return s.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

LearningPipeline::LearningPipeline(std::shared_ptr<vision::IEmbeddingGenerator> generator,
                                   std::shared_ptr<IPrototypeStore> store,
                                   LearningConfig cfg)
    : generator_(std::move(generator)), store_(std::move(store)), cfg_(cfg) {
  if (!generator_ || !store_) {
    throw std::invalid_argument("LearningPipeline: generator and store are required");
  }
  if (cfg_.min_exemplars == 0 || cfg_.min_exemplars > cfg_.max_exemplars) {
    throw std::invalid_argument("LearningPipeline: need 0 < min_exemplars <= max_exemplars");
  }
}

std::expected<core::Prototype, core::Error> LearningPipeline::learn(
    const std::string& label, std::span<const core::Image> exemplars) {
  const std::size_t n = exemplars.size();
  if (n < cfg_.min_exemplars || n > cfg_.max_exemplars) {
    return std::unexpected(core::make_error(
        core::ErrorCode::Validation,
        "need " + std::to_string(cfg_.min_exemplars) + ".." + std::to_string(cfg_.max_exemplars) +
            " exemplar images, got " + std::to_string(n)));
  }
  if (is_blank(label)) {
    return std::unexpected(core::make_error(core::ErrorCode::Validation, "label is empty"));
  }
  if (store_->contains(label)) {
    return std::unexpected(core::make_error(core::ErrorCode::DuplicateClass,
                                            "class '" + label + "' already exists"));
  }

  // One slot per exemplar; each worker writes only its own slot.
  std::vector<std::optional<std::expected<core::Embedding, core::Error>>> slots(n);
  {
    std::vector<std::thread> workers;
    workers.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
      workers.emplace_back([this, &exemplars, &slots, i]() {
        try {
          slots[i] = generator_->embed(exemplars[i]);
        } catch (const std::exception& e) {
          slots[i] = std::unexpected(core::make_error(core::ErrorCode::InvalidInput, e.what()));
        }
      });
    }
    for (auto& t : workers) {
      t.join();
    }
  }

  std::vector<core::Embedding> embeddings;
  embeddings.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    auto& r = *slots[i];
    if (!r) {
      core::Error err = r.error();
      err.message = "exemplar " + std::to_string(i) + ": " + err.message;
      return std::unexpected(std::move(err));
    }
    embeddings.push_back(std::move(*r));
  }

  auto mean = core::mean_embedding(embeddings);
  if (!mean) {
    return std::unexpected(mean.error());
  }

  core::Prototype prototype;
  prototype.label = label;
  prototype.vector = std::move(*mean);
  prototype.sample_count = static_cast<std::uint32_t>(n);
  prototype.created_at = std::chrono::system_clock::now();
  prototype.estimated_accuracy = cfg_.estimated_accuracy;

  // A racing learn() of the same label may win between contains() and here.
  auto stored = store_->put(prototype);
  if (!stored) {
    return std::unexpected(stored.error());
  }
  return prototype;
}

}  // namespace cropsight::fewshot
