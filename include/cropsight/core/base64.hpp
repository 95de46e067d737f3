#pragma once

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cropsight::core {

/// Standard alphabet, padded output.
[[nodiscard]] std::string base64_encode(std::span<const std::byte> bytes);

/// Decodes standard base64; whitespace is skipped, padding optional.
/// Returns nullopt on any character outside the alphabet.
[[nodiscard]] std::optional<std::vector<std::byte>> base64_decode(std::string_view text);

}  // namespace cropsight::core
