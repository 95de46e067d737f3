#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

namespace cropsight::vision {

/// Image intake and model-input preprocessing.
/// Defaults: 224x224 RGB, ImageNet mean/std, 10 MiB encoded size limit.
struct PreprocessConfig {
  std::uint32_t input_size{224};
  std::array<float, 3> mean{0.485f, 0.456f, 0.406f};
  std::array<float, 3> stddev{0.229f, 0.224f, 0.225f};
  std::size_t max_image_bytes{10u * 1024u * 1024u};
};

}  // namespace cropsight::vision
