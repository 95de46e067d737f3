#pragma once

#include <cropsight/core/error.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace cropsight::core {

/// Memory: Image owns a single contiguous buffer of encoded bytes (JPEG, PNG, ...);
/// it is decoded only by the embedding generator. Copies are deep; prefer moves.
/// Thread-safety: a const Image may be read from several threads.
class Image {
 public:
  Image() = default;

  explicit Image(std::vector<std::byte> encoded, std::string mime_type = "image/jpeg")
      : encoded_(std::move(encoded)), mime_type_(std::move(mime_type)) {}

  /// Accepts raw base64 or a "data:image/<type>;base64,<payload>" URI.
  [[nodiscard]] static std::expected<Image, Error> from_base64(std::string_view text);

  [[nodiscard]] std::span<const std::byte> bytes() const noexcept {
    return std::span<const std::byte>(encoded_.data(), encoded_.size());
  }
  [[nodiscard]] const std::string& mime_type() const noexcept { return mime_type_; }
  [[nodiscard]] bool empty() const noexcept { return encoded_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return encoded_.size(); }

  /// Base64 of the encoded bytes (no data URI prefix), for provider payloads.
  [[nodiscard]] std::string to_base64() const;

 private:
  std::vector<std::byte> encoded_;
  std::string mime_type_{"image/jpeg"};
};

}  // namespace cropsight::core
