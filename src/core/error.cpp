#include <cropsight/core/error.hpp>
#include <sstream>

namespace cropsight::core {

std::string_view to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::None:
      return "None";
    case ErrorCode::InvalidInput:
      return "InvalidInput";
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::DuplicateClass:
      return "DuplicateClass";
    case ErrorCode::Validation:
      return "Validation";
    case ErrorCode::NoPrototypes:
      return "NoPrototypes";
    case ErrorCode::DimensionMismatch:
      return "DimensionMismatch";
    case ErrorCode::ProviderFailed:
      return "ProviderFailed";
    case ErrorCode::Timeout:
      return "Timeout";
    case ErrorCode::AllProvidersFailed:
      return "AllProvidersFailed";
    case ErrorCode::EnrichmentFailed:
      return "EnrichmentFailed";
    case ErrorCode::InvalidConfig:
      return "InvalidConfig";
    default:
      return "Unknown";
  }
}

std::string describe(const Error& error) {
  std::ostringstream out;
  out << to_string(error.code);
  if (!error.message.empty()) out << ": " << error.message;
  for (const auto& f : error.provider_failures) {
    out << "\n  [" << f.provider_id << "] " << to_string(f.code);
    if (!f.reason.empty()) out << ": " << f.reason;
  }
  return out.str();
}

}  // namespace cropsight::core
