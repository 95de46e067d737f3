#include <cropsight/fewshot/prototype_classifier.hpp>
#include <cmath>
#include <vector>

namespace cropsight::fewshot {

namespace {

struct Scored {
  const core::Prototype* prototype;
  std::string key;
  float similarity;
};

/// Picks the top similarity among candidates not yet taken, then the smallest key among
/// every candidate within eps of it. Returns nullptr when all are taken.
const Scored* pick_best(const std::vector<Scored>& scored, const Scored* exclude, float eps) {
  float top = 0.f;
  bool any = false;
  for (const auto& s : scored) {
    if (&s == exclude) continue;
    if (!any || s.similarity > top) top = s.similarity;
    any = true;
  }
  if (!any) return nullptr;

  const Scored* pick = nullptr;
  for (const auto& s : scored) {
    if (&s == exclude || top - s.similarity > eps) continue;
    if (!pick || s.key < pick->key) pick = &s;
  }
  return pick;
}

}  // namespace

PrototypeClassifier::PrototypeClassifier(float tie_epsilon)
    : tie_epsilon_(tie_epsilon) {}

std::expected<Classification, core::Error> PrototypeClassifier::classify(
    std::span<const float> query,
    std::span<const core::Prototype> prototypes) const {
  if (prototypes.empty()) {
    return std::unexpected(
        core::make_error(core::ErrorCode::NoPrototypes, "no prototypes learned yet"));
  }

  std::vector<Scored> scored;
  scored.reserve(prototypes.size());
  for (const auto& p : prototypes) {
    auto sim = core::cosine_similarity(query, p.vector);
    if (!sim) {
      auto err = sim.error();
      err.message = "prototype '" + p.label + "': " + err.message;
      return std::unexpected(std::move(err));
    }
    scored.push_back({&p, core::label_key(p.label), *sim});
  }

  // Ties are measured against the top score, not pairwise, so the winner is the same
  // for every ordering of `prototypes`.
  const Scored* best = pick_best(scored, nullptr, tie_epsilon_);
  const Scored* second = pick_best(scored, best, tie_epsilon_);

  Classification out;
  out.label = best->prototype->label;
  out.similarity = best->similarity;
  out.confidence = core::similarity_to_confidence(best->similarity);
  if (second) {
    out.runner_up_label = second->prototype->label;
    out.runner_up_similarity = second->similarity;
  }
  return out;
}

}  // namespace cropsight::fewshot
