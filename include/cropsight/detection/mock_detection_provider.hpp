#pragma once

#include <cropsight/core/detection_result.hpp>
#include <cropsight/core/error.hpp>
#include <cropsight/core/image.hpp>
#include <cropsight/detection/detection_provider.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <expected>
#include <mutex>
#include <stop_token>
#include <string>

namespace cropsight::detection {

/// Mock provider for tests and demos: returns a fixed result or a fixed error,
/// optionally after a delay. The delay is interrupted by a stop request.
class MockDetectionProvider : public IDetectionProvider {
 public:
  explicit MockDetectionProvider(std::string id);

  void set_result(core::DetectionResult result);
  void set_error(core::Error error);
  void set_delay(std::chrono::milliseconds delay);

  [[nodiscard]] std::string id() const override { return id_; }

  [[nodiscard]] std::expected<core::DetectionResult, core::Error> detect(
      const core::Image& image, std::stop_token stop) override;

  [[nodiscard]] std::size_t calls() const noexcept { return calls_.load(); }

 private:
  std::string id_;
  mutable std::mutex mutex_;
  std::expected<core::DetectionResult, core::Error> outcome_;
  std::chrono::milliseconds delay_{0};
  std::atomic<std::size_t> calls_{0};
};

}  // namespace cropsight::detection
