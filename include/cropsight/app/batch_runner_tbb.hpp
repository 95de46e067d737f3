#pragma once

#include <cropsight/app/batch_runner.hpp>
#include <cropsight/app/detection_service.hpp>
#include <cropsight/core/image.hpp>
#include <vector>

#ifdef CROPSIGHT_HAS_TBB

namespace cropsight::app {

/// Classifies images in parallel with tbb::parallel_for.
///
/// DetectionService::classify() is called from TBB tasks; every embedding generator and
/// provider shipped here is safe for concurrent use. callback receives (index, result),
/// may be invoked from any TBB worker and must be thread-safe.
void classify_batch_tbb(const DetectionService& service,
                        const std::vector<core::Image>& images,
                        ClassifyCallback callback);

}  // namespace cropsight::app

#endif  // CROPSIGHT_HAS_TBB
