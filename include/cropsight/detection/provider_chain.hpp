#pragma once

#include <cropsight/core/detection_result.hpp>
#include <cropsight/core/error.hpp>
#include <cropsight/core/image.hpp>
#include <cropsight/detection/detection_provider.hpp>
#include <chrono>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cropsight::detection {

/// A provider and the time budget for one attempt against it.
struct ChainEntry {
  std::shared_ptr<IDetectionProvider> provider;
  std::chrono::milliseconds timeout{0};  // 0 = no deadline
};

enum class ChainState {
  Pending,
  Trying,
  Succeeded,
  AllFailed,
};

/// Reported once per attempt, in order.
struct AttemptInfo {
  std::size_t index{0};
  std::string provider_id;
  /// Succeeded; Trying when the chain moves on; AllFailed on the last failed attempt.
  ChainState state{ChainState::Trying};
  std::chrono::milliseconds elapsed{0};
  std::optional<core::Error> error;
};

/// Optional per-attempt report: pass to detect() to observe the chain.
using AttemptCallback = std::function<void(const AttemptInfo&)>;

/// Ordered fallback over detection providers.
///
/// Providers are tried strictly in order, one attempt each. A failure or timeout is logged
/// with the provider id and the chain moves on; the first success is returned with
/// provenance set to that provider's id. When every provider fails the result is
/// AllProvidersFailed carrying each provider's reason.
class ProviderChain {
 public:
  ProviderChain() = default;
  explicit ProviderChain(std::vector<ChainEntry> entries);

  void add(std::shared_ptr<IDetectionProvider> provider, std::chrono::milliseconds timeout);

  [[nodiscard]] std::expected<core::DetectionResult, core::Error> detect(
      const core::Image& image, const AttemptCallback* on_attempt = nullptr) const;

  [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
  [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
  [[nodiscard]] std::vector<std::string> provider_ids() const;

 private:
  std::vector<ChainEntry> entries_;
};

[[nodiscard]] std::string_view to_string(ChainState state) noexcept;

}  // namespace cropsight::detection
