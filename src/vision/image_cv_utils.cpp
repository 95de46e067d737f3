#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <cstddef>
#include <string>
#include <vector>

namespace cropsight::vision::detail {

namespace {

constexpr int kNumChannels = 3;

}  // namespace

std::expected<cv::Mat, core::Error> decode_rgb(const core::Image& image) {
  if (image.empty()) {
    return std::unexpected(core::make_error(core::ErrorCode::InvalidInput, "empty image"));
  }
  const auto bytes = image.bytes();
  const cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1,
                    const_cast<std::byte*>(bytes.data()));

  cv::Mat decoded;
  try {
    decoded = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
  } catch (const cv::Exception& e) {
    return std::unexpected(core::make_error(core::ErrorCode::InvalidInput, e.what()));
  }
  if (decoded.empty()) {
    return std::unexpected(
        core::make_error(core::ErrorCode::InvalidInput, "cannot decode image bytes"));
  }

  if (decoded.depth() != CV_8U) {
    cv::Mat eight_bit;
    decoded.convertTo(eight_bit, CV_8U, decoded.depth() == CV_16U ? 1.0 / 257.0 : 1.0);
    decoded = eight_bit;
  }

  cv::Mat rgb;
  switch (decoded.channels()) {
    case 1:
      cv::cvtColor(decoded, rgb, cv::COLOR_GRAY2RGB);
      break;
    case 3:
      cv::cvtColor(decoded, rgb, cv::COLOR_BGR2RGB);
      break;
    case 4:
      cv::cvtColor(decoded, rgb, cv::COLOR_BGRA2RGB);
      break;
    default:
      return std::unexpected(core::make_error(
          core::ErrorCode::InvalidInput,
          "unsupported channel count " + std::to_string(decoded.channels())));
  }
  return rgb;
}

std::vector<float> to_nchw_tensor(const cv::Mat& rgb, const PreprocessConfig& cfg) {
  const int side = static_cast<int>(cfg.input_size);

  cv::Mat resized;
  if (rgb.cols == side && rgb.rows == side) {
    resized = rgb;
  } else {
    cv::resize(rgb, resized, cv::Size(side, side), 0, 0, cv::INTER_LINEAR);
  }

  cv::Mat scaled;
  resized.convertTo(scaled, CV_32FC3, 1.0 / 255.0);

  const std::size_t hw = static_cast<std::size_t>(side) * side;
  std::vector<float> nchw(hw * kNumChannels);
  for (int y = 0; y < side; ++y) {
    const auto* row = scaled.ptr<cv::Vec3f>(y);
    for (int x = 0; x < side; ++x) {
      const std::size_t idx = static_cast<std::size_t>(y) * side + x;
      for (int c = 0; c < kNumChannels; ++c) {
        nchw[c * hw + idx] = (row[x][c] - cfg.mean[c]) / cfg.stddev[c];
      }
    }
  }
  return nchw;
}

}  // namespace cropsight::vision::detail
