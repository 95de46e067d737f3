#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cropsight::core {

/// Error codes; used with std::expected for recoverable failures.
enum class ErrorCode {
  None = 0,
  InvalidInput,        // undecodable / oversized image, bad arguments
  NotFound,            // unknown class label
  DuplicateClass,      // learn conflict
  Validation,          // exemplar count, empty label
  NoPrototypes,        // local path unavailable
  DimensionMismatch,   // embeddings of different length compared
  ProviderFailed,      // one detection provider failed
  Timeout,             // a bounded call exceeded its budget
  AllProvidersFailed,  // every provider in the chain failed
  EnrichmentFailed,    // knowledge provider failed
  InvalidConfig,
};

/// One provider's failure, collected by the provider chain for diagnostics.
struct ProviderFailure {
  std::string provider_id;
  ErrorCode code{ErrorCode::ProviderFailed};
  std::string reason;
};

/// Error value carried by std::expected.
/// provider_failures is only populated for ErrorCode::AllProvidersFailed.
struct Error {
  ErrorCode code{ErrorCode::None};
  std::string message;
  std::vector<ProviderFailure> provider_failures;
};

[[nodiscard]] inline Error make_error(ErrorCode code, std::string message) {
  return Error{code, std::move(message), {}};
}

[[nodiscard]] std::string_view to_string(ErrorCode code) noexcept;

/// "<code>: <message>" plus one line per provider failure.
[[nodiscard]] std::string describe(const Error& error);

}  // namespace cropsight::core
