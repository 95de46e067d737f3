#include <cropsight/core/image.hpp>
#include <cropsight/core/base64.hpp>
#include <utility>

namespace cropsight::core {

std::expected<Image, Error> Image::from_base64(std::string_view text) {
  std::string mime = "image/jpeg";
  // data:image/png;base64,<payload>
  if (text.starts_with("data:")) {
    const auto marker = text.find("base64,");
    if (marker == std::string_view::npos) {
      return std::unexpected(make_error(ErrorCode::InvalidInput, "data URI is not base64"));
    }
    const auto semi = text.find(';');
    if (semi != std::string_view::npos && semi > 5 && semi < marker) {
      mime.assign(text.substr(5, semi - 5));
    }
    text.remove_prefix(marker + 7);
  }
  auto bytes = base64_decode(text);
  if (!bytes) {
    return std::unexpected(make_error(ErrorCode::InvalidInput, "invalid base64 encoding"));
  }
  if (bytes->empty()) {
    return std::unexpected(make_error(ErrorCode::InvalidInput, "empty image payload"));
  }
  return Image(std::move(*bytes), std::move(mime));
}

std::string Image::to_base64() const {
  return base64_encode(bytes());
}

}  // namespace cropsight::core
