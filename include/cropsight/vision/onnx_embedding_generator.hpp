#pragma once

#include <cropsight/core/embedding.hpp>
#include <cropsight/core/error.hpp>
#include <cropsight/core/image.hpp>
#include <cropsight/vision/embedding_generator.hpp>
#include <cropsight/vision/preprocess_config.hpp>
#include <cstddef>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

namespace cropsight::vision {

/// ONNX Runtime embedding generator: loads an image encoder and implements IEmbeddingGenerator.
///
/// Expected model: one float image input, either NCHW [1,3,H,W] or NHWC [1,H,W,3], and one
/// output holding the embedding, [1,D] or [D]. Static H/W must match cfg.input_size; dynamic
/// spatial dims take cfg.input_size. The output is L2-normalized before it is returned.
///
/// Thread-safety: embed() may be called concurrently (Ort::Session::Run is thread-safe and
/// every call uses its own input buffer and RunOptions). A stop request terminates the
/// running inference through RunOptions::SetTerminate.
class OnnxEmbeddingGenerator : public IEmbeddingGenerator {
 public:
  /// \param model_path Path to the .onnx encoder.
  /// \param cfg Preprocessing (input size, mean/std, byte limit).
  /// \param expected_dim Embedding length; 0 = take it from the model output shape.
  /// Throws Ort::Exception if the model cannot be loaded and std::runtime_error if its
  /// input/output layout is unsupported or disagrees with expected_dim.
  explicit OnnxEmbeddingGenerator(std::string model_path,
                                  PreprocessConfig cfg = {},
                                  std::size_t expected_dim = core::kDefaultEmbeddingDim);

  ~OnnxEmbeddingGenerator() override;

  OnnxEmbeddingGenerator(const OnnxEmbeddingGenerator&) = delete;
  OnnxEmbeddingGenerator& operator=(const OnnxEmbeddingGenerator&) = delete;

  [[nodiscard]] std::expected<core::Embedding, core::Error> embed(
      const core::Image& image, std::stop_token stop = {}) override;

  [[nodiscard]] std::expected<void, core::Error> validate_input(
      const core::Image& image) const override;

  [[nodiscard]] std::size_t dimension() const noexcept override;

  [[nodiscard]] std::string name() const override { return "onnx"; }

  void warmup() override;

 private:
  [[nodiscard]] std::expected<core::Embedding, core::Error> run(std::vector<float>& nchw,
                                                                std::stop_token stop);

  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace cropsight::vision
