#pragma once

#include <cropsight/core/embedding.hpp>
#include <cropsight/core/error.hpp>
#include <cropsight/core/prototype.hpp>
#include <expected>
#include <optional>
#include <span>
#include <string>

namespace cropsight::fewshot {

/// Best match of a query embedding against a prototype set.
struct Classification {
  std::string label;
  float similarity{0.f};
  float confidence{0.f};
  /// Second-best match, for margin diagnostics. Empty with a single prototype.
  std::optional<std::string> runner_up_label;
  float runner_up_similarity{-1.f};
};

/// Nearest-prototype classifier using cosine similarity.
///
/// Confidence is (similarity + 1) / 2 clamped to [0, 1], so it never increases as the
/// query moves away from the winning prototype. Similarities within tie_epsilon of each
/// other are ties; the lexicographically smallest case-folded label wins, so the result
/// does not depend on the order of `prototypes`.
class PrototypeClassifier {
 public:
  explicit PrototypeClassifier(float tie_epsilon = 1e-6f);

  /// NoPrototypes if `prototypes` is empty; DimensionMismatch if any prototype's
  /// length differs from the query.
  [[nodiscard]] std::expected<Classification, core::Error> classify(
      std::span<const float> query,
      std::span<const core::Prototype> prototypes) const;

  [[nodiscard]] float tie_epsilon() const noexcept { return tie_epsilon_; }

 private:
  float tie_epsilon_;
};

}  // namespace cropsight::fewshot
