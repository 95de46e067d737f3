#pragma once

#include <cropsight/core/error.hpp>
#include <cropsight/core/image.hpp>
#include <cropsight/vision/preprocess_config.hpp>
#include <opencv2/core/mat.hpp>
#include <expected>
#include <vector>

namespace cropsight::vision::detail {

/// Decode encoded bytes to an 8-bit RGB cv::Mat (any input channel layout).
/// InvalidInput if the bytes are not a decodable image.
std::expected<cv::Mat, core::Error> decode_rgb(const core::Image& image);

/// Resize to input_size x input_size, scale to [0,1], normalize per channel, HWC -> NCHW.
std::vector<float> to_nchw_tensor(const cv::Mat& rgb, const PreprocessConfig& cfg);

}  // namespace cropsight::vision::detail
