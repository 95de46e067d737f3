#include <cropsight/core/prototype.hpp>
#include <algorithm>
#include <cctype>

namespace cropsight::core {

std::string label_key(std::string_view label) {
  std::string key(label);
  std::transform(key.begin(), key.end(), key.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return key;
}

}  // namespace cropsight::core
