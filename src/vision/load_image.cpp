#include <cropsight/vision/load_image.hpp>
#include "image_cv_utils.hpp"
#include <algorithm>
#include <cctype>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>

namespace cropsight::vision {

namespace {

std::string mime_from_extension(const std::filesystem::path& path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (ext == ".png") return "image/png";
  if (ext == ".webp") return "image/webp";
  if (ext == ".bmp") return "image/bmp";
  return "image/jpeg";
}

}  // namespace

std::optional<core::Image> load_image_file(const std::string& path) {
  std::ifstream f(path, std::ios::binary);
  if (!f) return std::nullopt;

  std::vector<char> raw((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
  if (raw.empty()) return std::nullopt;

  std::vector<std::byte> bytes(raw.size());
  std::memcpy(bytes.data(), raw.data(), raw.size());
  return core::Image(std::move(bytes), mime_from_extension(path));
}

std::expected<void, core::Error> check_image_size(const core::Image& image,
                                                  std::size_t max_bytes) {
  if (image.empty()) {
    return std::unexpected(core::make_error(core::ErrorCode::InvalidInput, "empty image"));
  }
  if (max_bytes > 0 && image.size_bytes() > max_bytes) {
    return std::unexpected(core::make_error(
        core::ErrorCode::InvalidInput,
        "image size " + std::to_string(image.size_bytes()) + " bytes exceeds limit of " +
            std::to_string(max_bytes)));
  }
  return {};
}

std::expected<std::vector<float>, core::Error> preprocess_image(const core::Image& image,
                                                                const PreprocessConfig& cfg) {
  auto size_ok = check_image_size(image, cfg.max_image_bytes);
  if (!size_ok) {
    return std::unexpected(size_ok.error());
  }
  auto rgb = detail::decode_rgb(image);
  if (!rgb) {
    return std::unexpected(rgb.error());
  }
  return detail::to_nchw_tensor(*rgb, cfg);
}

}  // namespace cropsight::vision
