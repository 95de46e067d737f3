#pragma once

#include <cropsight/core/error.hpp>
#include <cropsight/core/prototype.hpp>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace cropsight::fewshot {

/// Abstract prototype store: one prototype per class label (case-insensitive).
/// Implementations must allow concurrent readers while a put() is in flight and
/// must let exactly one of two racing put()s of the same label win.
class IPrototypeStore {
 public:
  virtual ~IPrototypeStore() = default;

  /// NotFound if no prototype has this label.
  [[nodiscard]] virtual std::expected<core::Prototype, core::Error> get(
      std::string_view label) const = 0;

  /// DuplicateClass if the label already exists; the stored prototype is untouched.
  [[nodiscard]] virtual std::expected<void, core::Error> put(core::Prototype prototype) = 0;

  [[nodiscard]] virtual bool contains(std::string_view label) const = 0;

  /// Snapshot of every prototype; order is unspecified.
  [[nodiscard]] virtual std::vector<core::Prototype> all() const = 0;

  [[nodiscard]] virtual std::size_t size() const = 0;
};

/// In-memory store with copy-on-write snapshots.
///
/// Readers copy a shared_ptr to the current immutable map and iterate it without
/// holding the lock; put() builds a new map under the writer mutex and swaps it in.
class InMemoryPrototypeStore : public IPrototypeStore {
 public:
  InMemoryPrototypeStore();

  [[nodiscard]] std::expected<core::Prototype, core::Error> get(
      std::string_view label) const override;

  [[nodiscard]] std::expected<void, core::Error> put(core::Prototype prototype) override;

  [[nodiscard]] bool contains(std::string_view label) const override;

  [[nodiscard]] std::vector<core::Prototype> all() const override;

  [[nodiscard]] std::size_t size() const override;

 private:
  /// Keyed by core::label_key(label); ordered so all() is stable across calls.
  using Snapshot = std::map<std::string, core::Prototype>;

  [[nodiscard]] std::shared_ptr<const Snapshot> snapshot() const;

  mutable std::mutex mutex_;
  std::shared_ptr<const Snapshot> current_;
};

}  // namespace cropsight::fewshot
