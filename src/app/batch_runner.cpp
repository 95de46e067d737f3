#include <cropsight/app/batch_runner.hpp>
#include <algorithm>
#include <atomic>
#include <thread>
#include <utility>
#include <vector>

namespace cropsight::app {

void classify_batch(const DetectionService& service,
                    const std::vector<core::Image>& images,
                    ClassifyCallback callback) {
  if (!callback) return;
  for (std::size_t i = 0; i < images.size(); ++i) {
    callback(i, service.classify(images[i]));
  }
}

namespace {

std::size_t effective_workers(std::size_t num_workers) {
  if (num_workers > 0) return num_workers;
  const unsigned hw = std::thread::hardware_concurrency();
  return hw > 0 ? static_cast<std::size_t>(hw) : 1;
}

}  // namespace

void classify_batch_parallel(const DetectionService& service,
                             const std::vector<core::Image>& images,
                             ClassifyCallback callback,
                             std::size_t num_workers) {
  const std::size_t n = images.size();
  if (n == 0 || !callback) return;

  const std::size_t workers = std::min(effective_workers(num_workers), n);
  if (workers <= 1) {
    classify_batch(service, images, std::move(callback));
    return;
  }

  // Workers claim the next unclassified index until none are left.
  std::atomic<std::size_t> next{0};
  auto worker = [&]() {
    for (std::size_t idx = next++; idx < n; idx = next++) {
      callback(idx, service.classify(images[idx]));
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace cropsight::app
