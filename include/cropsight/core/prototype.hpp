#pragma once

#include <cropsight/core/embedding.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

namespace cropsight::core {

/// Mean embedding of a handful of exemplar images for one class.
/// Created by the learning pipeline; read-only afterwards.
struct Prototype {
  std::string label;
  Embedding vector;
  std::uint32_t sample_count{0};
  std::chrono::system_clock::time_point created_at{};
  float estimated_accuracy{0.f};
};

/// Case-folded form of a label; the store and classifier key on this.
[[nodiscard]] std::string label_key(std::string_view label);

}  // namespace cropsight::core
