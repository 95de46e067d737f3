// Unit tests for OnnxEmbeddingGenerator.
// One test runs without a model (constructor with missing file). The rest require a real
// image encoder: set CROPSIGHT_TEST_ONNX_MODEL to the path of a .onnx file with a
// [1,3,224,224] float input and a 512-value embedding output.
// They are skipped if the env var is unset or the file is missing, so CI without a model still passes.
#include <cropsight/core/embedding.hpp>
#include <cropsight/core/error.hpp>
#include <cropsight/core/image.hpp>
#include <cropsight/vision/onnx_embedding_generator.hpp>
#include <onnxruntime_cxx_api.h>
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <gtest/gtest.h>
#include <cstddef>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace nv = cropsight::vision;
namespace nc = cropsight::core;

static std::string get_test_model_path() {
  const char* env = std::getenv("CROPSIGHT_TEST_ONNX_MODEL");
  if (env && env[0] != '\0' && std::filesystem::exists(env)) {
    return env;
  }
  return "";
}

static nc::Image make_jpeg(int w, int h, const cv::Scalar& bgr) {
  cv::Mat m(h, w, CV_8UC3, bgr);
  cv::rectangle(m, cv::Rect(w / 4, h / 4, w / 2, h / 2), cv::Scalar(20, 160, 40), -1);
  std::vector<uchar> buf;
  cv::imencode(".jpg", m, buf);
  std::vector<std::byte> bytes(buf.size());
  for (std::size_t i = 0; i < buf.size(); ++i) bytes[i] = static_cast<std::byte>(buf[i]);
  return nc::Image(std::move(bytes));
}

// --- Tests that run without a model ---

TEST(OnnxEmbeddingGenerator, ConstructorThrowsWhenFileMissing) {
  // ONNX Runtime throws Ort::Exception when the model file does not exist.
  EXPECT_THROW(
      { nv::OnnxEmbeddingGenerator gen("nonexistent_encoder_12345_should_not_exist.onnx"); },
      Ort::Exception);
}

// --- Tests that require a real ONNX model (skip if CROPSIGHT_TEST_ONNX_MODEL not set or missing) ---

TEST(OnnxEmbeddingGenerator, EmbedReturnsUnitVectorOfModelDimension) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set CROPSIGHT_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  nv::OnnxEmbeddingGenerator gen(path, nv::PreprocessConfig{}, 0);
  gen.warmup();
  auto e = gen.embed(make_jpeg(300, 200, cv::Scalar(30, 90, 200)));
  ASSERT_TRUE(e.has_value()) << e.error().message;
  EXPECT_EQ(e->size(), gen.dimension());
  EXPECT_NEAR(nc::l2_norm(*e), 1.f, 1e-4f);
  EXPECT_EQ(gen.name(), "onnx");
}

TEST(OnnxEmbeddingGenerator, EmbedIsDeterministic) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set CROPSIGHT_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  nv::OnnxEmbeddingGenerator gen(path, nv::PreprocessConfig{}, 0);
  const auto img = make_jpeg(128, 128, cv::Scalar(50, 50, 50));
  auto a = gen.embed(img);
  auto b = gen.embed(img);
  ASSERT_TRUE(a.has_value());
  ASSERT_TRUE(b.has_value());
  ASSERT_EQ(a->size(), b->size());
  for (std::size_t i = 0; i < a->size(); ++i) {
    EXPECT_FLOAT_EQ((*a)[i], (*b)[i]);
  }
}

TEST(OnnxEmbeddingGenerator, UndecodableImageIsInvalidInput) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set CROPSIGHT_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  nv::OnnxEmbeddingGenerator gen(path, nv::PreprocessConfig{}, 0);
  nc::Image junk(std::vector<std::byte>(32, std::byte{7}));
  auto e = gen.embed(junk);
  ASSERT_FALSE(e.has_value());
  EXPECT_EQ(e.error().code, nc::ErrorCode::InvalidInput);
}

TEST(OnnxEmbeddingGenerator, ValidateInputRejectsOversizedImage) {
  const std::string path = get_test_model_path();
  if (path.empty()) {
    GTEST_SKIP() << "Set CROPSIGHT_TEST_ONNX_MODEL to run (path to .onnx file)";
  }
  nv::PreprocessConfig cfg;
  cfg.max_image_bytes = 16;
  nv::OnnxEmbeddingGenerator gen(path, cfg, 0);
  auto valid = gen.validate_input(make_jpeg(64, 64, cv::Scalar(0, 0, 0)));
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error().code, nc::ErrorCode::InvalidInput);
}
