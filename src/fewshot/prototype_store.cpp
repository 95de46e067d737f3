#include <cropsight/fewshot/prototype_store.hpp>

namespace cropsight::fewshot {

InMemoryPrototypeStore::InMemoryPrototypeStore()
    : current_(std::make_shared<const Snapshot>()) {}

std::shared_ptr<const InMemoryPrototypeStore::Snapshot> InMemoryPrototypeStore::snapshot() const {
  std::lock_guard lock(mutex_);
  return current_;
}

std::expected<core::Prototype, core::Error> InMemoryPrototypeStore::get(
    std::string_view label) const {
  const auto snap = snapshot();
  const auto it = snap->find(core::label_key(label));
  if (it == snap->end()) {
    return std::unexpected(
        core::make_error(core::ErrorCode::NotFound, "unknown class '" + std::string(label) + "'"));
  }
  return it->second;
}

std::expected<void, core::Error> InMemoryPrototypeStore::put(core::Prototype prototype) {
  if (prototype.label.empty()) {
    return std::unexpected(core::make_error(core::ErrorCode::Validation, "empty class label"));
  }
  std::string key = core::label_key(prototype.label);

  std::lock_guard lock(mutex_);
  if (current_->contains(key)) {
    return std::unexpected(core::make_error(
        core::ErrorCode::DuplicateClass, "class '" + prototype.label + "' already exists"));
  }
  auto next = std::make_shared<Snapshot>(*current_);
  next->emplace(std::move(key), std::move(prototype));
  current_ = std::move(next);
  return {};
}

bool InMemoryPrototypeStore::contains(std::string_view label) const {
  return snapshot()->contains(core::label_key(label));
}

std::vector<core::Prototype> InMemoryPrototypeStore::all() const {
  const auto snap = snapshot();
  std::vector<core::Prototype> out;
  out.reserve(snap->size());
  for (const auto& [key, prototype] : *snap) {
    out.push_back(prototype);
  }
  return out;
}

std::size_t InMemoryPrototypeStore::size() const {
  return snapshot()->size();
}

}  // namespace cropsight::fewshot
