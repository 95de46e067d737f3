#pragma once

#include <cropsight/app/config.hpp>
#include <cropsight/app/detection_service.hpp>
#include <cropsight/detection/http_transport.hpp>
#include <cropsight/vision/embedding_generator.hpp>
#include <memory>

namespace cropsight::app {

/// Embedding generator for cfg: MockEmbeddingGenerator, or OnnxEmbeddingGenerator (warmed
/// up). Throws std::runtime_error if onnx is selected without model_path; ONNX Runtime
/// errors propagate as Ort::Exception.
[[nodiscard]] std::shared_ptr<vision::IEmbeddingGenerator> make_embedding_generator(
    const ServiceConfig& cfg);

/// Wires a DetectionService from cfg: generator, store (loaded from prototypes_path),
/// providers in provider_order with their timeouts, knowledge provider and gate.
/// `transport` is used by every external provider; null = HttplibTransport.
/// Throws std::invalid_argument for an unknown provider name and std::runtime_error
/// when the prototypes or knowledge base file cannot be loaded.
[[nodiscard]] std::unique_ptr<DetectionService> build_service(
    const ServiceConfig& cfg,
    std::shared_ptr<detection::IHttpTransport> transport = nullptr);

/// Same, with an embedding generator supplied by the caller.
[[nodiscard]] std::unique_ptr<DetectionService> build_service(
    const ServiceConfig& cfg,
    std::shared_ptr<vision::IEmbeddingGenerator> generator,
    std::shared_ptr<detection::IHttpTransport> transport);

}  // namespace cropsight::app
