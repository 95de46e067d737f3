#pragma once

#include <cropsight/app/detection_service.hpp>
#include <cropsight/core/detection_result.hpp>
#include <cropsight/core/error.hpp>
#include <cropsight/core/image.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <vector>

namespace cropsight::app {

/// Callback for each classified image: (index into images, result or error).
/// Must be thread-safe if using classify_batch_parallel or classify_batch_tbb.
using ClassifyCallback = std::function<void(
    std::size_t index, const std::expected<core::DetectionResult, core::Error>& result)>;

/// Classifies images one after another; calls callback for each, in order.
void classify_batch(const DetectionService& service,
                    const std::vector<core::Image>& images,
                    ClassifyCallback callback);

/// Classifies images in parallel using a thread pool. callback may be invoked from any
/// worker, in any order. num_workers 0 = use hardware concurrency.
void classify_batch_parallel(const DetectionService& service,
                             const std::vector<core::Image>& images,
                             ClassifyCallback callback,
                             std::size_t num_workers = 0);

}  // namespace cropsight::app
