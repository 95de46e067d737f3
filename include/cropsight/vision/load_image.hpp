#pragma once

#include <cropsight/core/error.hpp>
#include <cropsight/core/image.hpp>
#include <cropsight/vision/preprocess_config.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <string>
#include <vector>

namespace cropsight::vision {

/// Read an image file's encoded bytes; MIME type guessed from the extension.
/// Returns nullopt if the file cannot be read or is empty.
std::optional<core::Image> load_image_file(const std::string& path);

/// InvalidInput if the image is empty or larger than max_bytes.
[[nodiscard]] std::expected<void, core::Error> check_image_size(const core::Image& image,
                                                                std::size_t max_bytes);

/// Decode, convert to RGB, resize and normalize to a 1x3xHxW float tensor (NCHW order).
[[nodiscard]] std::expected<std::vector<float>, core::Error> preprocess_image(
    const core::Image& image, const PreprocessConfig& cfg);

}  // namespace cropsight::vision
