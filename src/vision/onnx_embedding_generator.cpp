#include <cropsight/vision/onnx_embedding_generator.hpp>
#include <cropsight/vision/load_image.hpp>
#include <onnxruntime_cxx_api.h>
#include <array>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <vector>

namespace cropsight::vision {

namespace {

constexpr std::int64_t kNumChannels = 3;

Ort::MemoryInfo CpuMemoryInfo() {
  return Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
}

/// Copy NCHW (channels, height, width) to NHWC for models that want channels last.
std::vector<float> NchwToNhwc(const std::vector<float>& nchw, std::int64_t h, std::int64_t w) {
  const std::size_t hw = static_cast<std::size_t>(h * w);
  std::vector<float> nhwc(nchw.size());
  for (std::size_t i = 0; i < hw; ++i) {
    nhwc[i * kNumChannels + 0] = nchw[0 * hw + i];
    nhwc[i * kNumChannels + 1] = nchw[1 * hw + i];
    nhwc[i * kNumChannels + 2] = nchw[2 * hw + i];
  }
  return nhwc;
}

}  // namespace

struct OnnxEmbeddingGenerator::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "cropsight"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  PreprocessConfig cfg;
  std::string input_name;
  std::string output_name;
  bool input_is_nchw{true};
  std::size_t dim{0};

  Impl() {
    session_options.SetIntraOpNumThreads(1);
    session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  }
};

OnnxEmbeddingGenerator::OnnxEmbeddingGenerator(std::string model_path,
                                               PreprocessConfig cfg,
                                               std::size_t expected_dim)
    : impl_(std::make_unique<Impl>()) {
  impl_->cfg = cfg;
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxEmbeddingGenerator: model has no inputs");
  }
  impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();

  const auto in_dims = impl_->session.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
  if (in_dims.size() != 4u) {
    throw std::runtime_error("OnnxEmbeddingGenerator: expected 4D image input");
  }
  const auto side = static_cast<std::int64_t>(cfg.input_size);
  auto spatial_ok = [side](std::int64_t d) { return d <= 0 || d == side; };
  if (in_dims[1] == kNumChannels && spatial_ok(in_dims[2]) && spatial_ok(in_dims[3])) {
    impl_->input_is_nchw = true;
  } else if (in_dims[3] == kNumChannels && spatial_ok(in_dims[1]) && spatial_ok(in_dims[2])) {
    impl_->input_is_nchw = false;
  } else {
    throw std::runtime_error("OnnxEmbeddingGenerator: expected input [1,3," +
                             std::to_string(side) + "," + std::to_string(side) + "] or [1," +
                             std::to_string(side) + "," + std::to_string(side) + ",3]");
  }

  if (impl_->session.GetOutputCount() == 0) {
    throw std::runtime_error("OnnxEmbeddingGenerator: model has no outputs");
  }
  impl_->output_name = impl_->session.GetOutputNameAllocated(0, allocator).get();

  const auto out_dims =
      impl_->session.GetOutputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
  const std::int64_t model_dim = out_dims.empty() ? -1 : out_dims.back();
  if (model_dim > 0) {
    if (expected_dim != 0 && static_cast<std::size_t>(model_dim) != expected_dim) {
      throw std::runtime_error("OnnxEmbeddingGenerator: model embedding length " +
                               std::to_string(model_dim) + " != configured " +
                               std::to_string(expected_dim));
    }
    impl_->dim = static_cast<std::size_t>(model_dim);
  } else if (expected_dim != 0) {
    impl_->dim = expected_dim;
  } else {
    throw std::runtime_error(
        "OnnxEmbeddingGenerator: dynamic output length and no expected_dim given");
  }
}

OnnxEmbeddingGenerator::~OnnxEmbeddingGenerator() = default;

std::size_t OnnxEmbeddingGenerator::dimension() const noexcept {
  return impl_->dim;
}

std::expected<void, core::Error> OnnxEmbeddingGenerator::validate_input(
    const core::Image& image) const {
  return check_image_size(image, impl_->cfg.max_image_bytes);
}

std::expected<core::Embedding, core::Error> OnnxEmbeddingGenerator::embed(
    const core::Image& image, std::stop_token stop) {
  auto tensor = preprocess_image(image, impl_->cfg);
  if (!tensor) {
    return std::unexpected(tensor.error());
  }
  return run(*tensor, stop);
}

std::expected<core::Embedding, core::Error> OnnxEmbeddingGenerator::run(
    std::vector<float>& nchw, std::stop_token stop) {
  if (stop.stop_requested()) {
    return std::unexpected(core::make_error(core::ErrorCode::Timeout, "inference cancelled"));
  }
  const auto side = static_cast<std::int64_t>(impl_->cfg.input_size);
  std::vector<float> input = impl_->input_is_nchw ? std::move(nchw) : NchwToNhwc(nchw, side, side);

  const std::array<std::int64_t, 4> shape =
      impl_->input_is_nchw ? std::array<std::int64_t, 4>{1, kNumChannels, side, side}
                           : std::array<std::int64_t, 4>{1, side, side, kNumChannels};

  Ort::MemoryInfo mem_info = CpuMemoryInfo();
  Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
      mem_info, input.data(), input.size(), shape.data(), shape.size());

  const char* input_names[] = {impl_->input_name.c_str()};
  const char* output_names[] = {impl_->output_name.c_str()};
  Ort::RunOptions run_options;
  std::stop_callback terminate_on_stop(stop, [&run_options] { run_options.SetTerminate(); });

  std::vector<Ort::Value> outputs;
  try {
    outputs = impl_->session.Run(run_options, input_names, &input_tensor, 1, output_names, 1);
  } catch (const Ort::Exception& e) {
    if (stop.stop_requested()) {
      return std::unexpected(core::make_error(core::ErrorCode::Timeout,
                                              std::string("inference terminated: ") + e.what()));
    }
    return std::unexpected(core::make_error(core::ErrorCode::InvalidInput,
                                            std::string("inference failed: ") + e.what()));
  }
  if (outputs.size() != 1u) {
    return std::unexpected(
        core::make_error(core::ErrorCode::InvalidInput, "encoder returned no output"));
  }

  const auto count = outputs[0].GetTensorTypeAndShapeInfo().GetElementCount();
  if (count != impl_->dim) {
    return std::unexpected(core::make_error(
        core::ErrorCode::DimensionMismatch,
        "encoder produced " + std::to_string(count) + " values, expected " +
            std::to_string(impl_->dim)));
  }
  const float* data = outputs[0].GetTensorData<float>();
  return core::l2_normalized(std::span<const float>(data, count));
}

void OnnxEmbeddingGenerator::warmup() {
  const std::size_t side = impl_->cfg.input_size;
  std::vector<float> zeros(side * side * kNumChannels, 0.f);
  (void)run(zeros, {});
}

}  // namespace cropsight::vision
