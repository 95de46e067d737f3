#include <cropsight/app/batch_runner_tbb.hpp>

#ifdef CROPSIGHT_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <cstddef>

namespace cropsight::app {

void classify_batch_tbb(const DetectionService& service,
                        const std::vector<core::Image>& images,
                        ClassifyCallback callback) {
  if (images.empty() || !callback) return;

  tbb::parallel_for(
      tbb::blocked_range<std::size_t>(0, images.size()),
      [&service, &images, &callback](const tbb::blocked_range<std::size_t>& range) {
        for (std::size_t i = range.begin(); i != range.end(); ++i) {
          callback(i, service.classify(images[i]));
        }
      });
}

}  // namespace cropsight::app

#endif  // CROPSIGHT_HAS_TBB
