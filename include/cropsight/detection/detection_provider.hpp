#pragma once

#include <cropsight/core/detection_result.hpp>
#include <cropsight/core/error.hpp>
#include <cropsight/core/image.hpp>
#include <expected>
#include <stop_token>
#include <string>

namespace cropsight::detection {

/// One detection strategy: the local prototype classifier or an external image
/// understanding service. The provider chain tries them in configured order.
///
/// detect() may run on a worker thread that the chain abandons after its timeout;
/// implementations should check `stop` between blocking steps and must not keep
/// references to the image after returning.
class IDetectionProvider {
 public:
  virtual ~IDetectionProvider() = default;

  /// Stable identifier, used as provenance and in failure reports.
  [[nodiscard]] virtual std::string id() const = 0;

  [[nodiscard]] virtual std::expected<core::DetectionResult, core::Error> detect(
      const core::Image& image, std::stop_token stop) = 0;
};

}  // namespace cropsight::detection
