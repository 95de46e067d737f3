#pragma once

#include <cropsight/core/error.hpp>
#include <cropsight/core/prototype.hpp>
#include <cropsight/fewshot/prototype_store.hpp>
#include <expected>
#include <string>
#include <vector>

namespace cropsight::app {

/// JSON file of learned prototypes:
/// {"version":1,"prototypes":[{"label","vector","sample_count","created_at_ms","estimated_accuracy"}]}

/// Empty list if the file does not exist; InvalidConfig if it cannot be parsed.
[[nodiscard]] std::expected<std::vector<core::Prototype>, core::Error> load_prototypes(
    const std::string& path);

/// Writes to a temporary file and renames it over `path`.
[[nodiscard]] std::expected<void, core::Error> save_prototypes(
    const std::string& path, const std::vector<core::Prototype>& prototypes);

/// Loads `path` into `store`. A prototype whose length differs from `dimension` is
/// DimensionMismatch; a repeated label is DuplicateClass. Returns the number loaded.
[[nodiscard]] std::expected<std::size_t, core::Error> load_into_store(
    const std::string& path, fewshot::IPrototypeStore& store, std::size_t dimension);

}  // namespace cropsight::app
