#include <cropsight/detection/provider_chain.hpp>
#include <cropsight/core/timed_call.hpp>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace cropsight::detection {

ProviderChain::ProviderChain(std::vector<ChainEntry> entries) : entries_(std::move(entries)) {
  for (const auto& e : entries_) {
    if (!e.provider) {
      throw std::invalid_argument("ProviderChain: null provider");
    }
  }
}

void ProviderChain::add(std::shared_ptr<IDetectionProvider> provider,
                        std::chrono::milliseconds timeout) {
  if (!provider) {
    throw std::invalid_argument("ProviderChain: null provider");
  }
  entries_.push_back(ChainEntry{std::move(provider), timeout});
}

std::vector<std::string> ProviderChain::provider_ids() const {
  std::vector<std::string> ids;
  ids.reserve(entries_.size());
  for (const auto& e : entries_) {
    ids.push_back(e.provider->id());
  }
  return ids;
}

std::expected<core::DetectionResult, core::Error> ProviderChain::detect(
    const core::Image& image, const AttemptCallback* on_attempt) const {
  using clock = std::chrono::steady_clock;

  if (entries_.empty()) {
    return std::unexpected(
        core::make_error(core::ErrorCode::AllProvidersFailed, "no detection providers configured"));
  }

  // Abandoned attempts keep running after a timeout, so they get their own copy.
  const auto owned_image = std::make_shared<const core::Image>(image);
  std::vector<core::ProviderFailure> failures;

  for (std::size_t i = 0; i < entries_.size(); ++i) {
    const auto provider = entries_[i].provider;
    const std::string id = provider->id();
    const auto start = clock::now();

    auto result = core::call_with_timeout<core::DetectionResult>(
        [provider, owned_image](std::stop_token stop) {
          return provider->detect(*owned_image, stop);
        },
        entries_[i].timeout);

    AttemptInfo info;
    info.index = i;
    info.provider_id = id;
    info.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(clock::now() - start);

    if (result) {
      result->provenance = id;
      info.state = ChainState::Succeeded;
      if (on_attempt && *on_attempt) (*on_attempt)(info);
      return result;
    }

    std::cerr << "[ProviderChain] " << id << " failed (" << core::to_string(result.error().code)
              << "): " << result.error().message << "\n";
    failures.push_back(core::ProviderFailure{id, result.error().code, result.error().message});
    info.error = result.error();
    info.state = i + 1 == entries_.size() ? ChainState::AllFailed : ChainState::Trying;
    if (on_attempt && *on_attempt) (*on_attempt)(info);
  }

  core::Error err = core::make_error(
      core::ErrorCode::AllProvidersFailed,
      "detection unavailable: all " + std::to_string(failures.size()) + " providers failed");
  err.provider_failures = std::move(failures);
  return std::unexpected(std::move(err));
}

std::string_view to_string(ChainState state) noexcept {
  switch (state) {
    case ChainState::Pending:
      return "pending";
    case ChainState::Trying:
      return "trying";
    case ChainState::Succeeded:
      return "succeeded";
    case ChainState::AllFailed:
      return "all_failed";
  }
  return "unknown";
}

}  // namespace cropsight::detection
