#include <cropsight/detection/mock_detection_provider.hpp>
#include <condition_variable>
#include <utility>

namespace cropsight::detection {

MockDetectionProvider::MockDetectionProvider(std::string id)
    : id_(std::move(id)),
      outcome_(std::unexpected(
          core::make_error(core::ErrorCode::ProviderFailed, "mock provider not configured"))) {}

void MockDetectionProvider::set_result(core::DetectionResult result) {
  std::lock_guard lock(mutex_);
  outcome_ = std::move(result);
}

void MockDetectionProvider::set_error(core::Error error) {
  std::lock_guard lock(mutex_);
  outcome_ = std::unexpected(std::move(error));
}

void MockDetectionProvider::set_delay(std::chrono::milliseconds delay) {
  std::lock_guard lock(mutex_);
  delay_ = delay;
}

std::expected<core::DetectionResult, core::Error> MockDetectionProvider::detect(
    const core::Image& /*image*/, std::stop_token stop) {
  calls_++;
  std::unique_lock lock(mutex_);
  if (delay_.count() > 0) {
    std::condition_variable_any cv;
    if (cv.wait_for(lock, stop, delay_, [] { return false; }) || stop.stop_requested()) {
      return std::unexpected(core::make_error(core::ErrorCode::Timeout, id_ + " cancelled"));
    }
  }
  return outcome_;
}

}  // namespace cropsight::detection
