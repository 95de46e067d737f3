/**
 * cropsight-cli: Identify crop pests/diseases from images; learn new classes from exemplars.
 * Build: cmake -B build && cmake --build build
 * Run:   ./build/cropsight_cli [--config path] classify <image>...
 *        ./build/cropsight_cli [--config path] learn <label> <image> <image> ...
 *        ./build/cropsight_cli [--config path] list | health
 */

#include <cropsight/app/batch_runner.hpp>
#include <cropsight/app/config.hpp>
#include <cropsight/app/detection_service.hpp>
#include <cropsight/app/service_builder.hpp>
#include <cropsight/core/detection_result.hpp>
#include <cropsight/core/error.hpp>
#include <cropsight/core/image.hpp>
#include <cropsight/vision/load_image.hpp>

#include <chrono>
#include <ctime>
#include <exception>
#include <expected>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void print_usage() {
  std::cout << "Usage: cropsight_cli [options] <command> [args]\n"
            << "Commands:\n"
            << "  classify <image>...              Identify the pest/disease in each image\n"
            << "  learn <label> <image>...         Learn a new class from 5-10 exemplar images\n"
            << "  list                             List learned classes\n"
            << "  health                           Show backend and provider status\n"
            << "Options:\n"
            << "  --config <path>   Service config (key=value file); default: built-in (mock)\n"
            << "  --backend <type>  Override embedding backend: mock | onnx\n"
            << "  --model <path>    Override model path (required for --backend onnx)\n"
            << "\nAPI keys are read from GEMINI_API_KEY, GROQ_API_KEY, OPENAI_API_KEY, "
               "CEREBRAS_API_KEY.\n";
}

void print_list(std::ostream& out, const char* title, const std::vector<std::string>& items) {
  if (items.empty()) return;
  out << "  " << title << ":\n";
  for (const auto& s : items) out << "    - " << s << "\n";
}

std::string format_result(const cropsight::core::DetectionResult& r) {
  std::ostringstream out;
  out << "label=" << r.label << " confidence=" << std::fixed << std::setprecision(3)
      << r.confidence << " risk=" << cropsight::core::to_string(r.risk_level)
      << " provenance=" << r.provenance << (r.enriched ? " enriched" : "") << "\n";
  if (r.plant) out << "  plant: " << *r.plant << "\n";
  if (r.pathogen) out << "  pathogen: " << *r.pathogen << "\n";
  if (r.symptoms) print_list(out, "symptoms", *r.symptoms);
  if (r.treatment) {
    print_list(out, "immediate actions", r.treatment->immediate_actions);
    print_list(out, "chemical control", r.treatment->chemical_control);
    print_list(out, "organic control", r.treatment->organic_control);
    print_list(out, "cultural practices", r.treatment->cultural_practices);
    print_list(out, "maintenance", r.treatment->maintenance);
  }
  if (r.prevention) print_list(out, "prevention", *r.prevention);
  if (r.prognosis) out << "  prognosis: " << *r.prognosis << "\n";
  if (r.spread_risk) out << "  spread risk: " << *r.spread_risk << "\n";
  return out.str();
}

bool load_images(const std::vector<std::string>& paths, std::vector<cropsight::core::Image>& out) {
  for (const auto& p : paths) {
    auto img = cropsight::vision::load_image_file(p);
    if (!img) {
      std::cerr << "Failed to load image: " << p << "\n";
      return false;
    }
    out.push_back(std::move(*img));
  }
  return true;
}

int run_classify(const cropsight::app::DetectionService& service,
                 const std::vector<std::string>& paths) {
  if (paths.empty()) {
    std::cerr << "classify: no images given\n";
    return 1;
  }
  std::vector<cropsight::core::Image> images;
  if (!load_images(paths, images)) return 1;

  int failures = 0;
  cropsight::app::classify_batch(
      service, images,
      [&](std::size_t i, const std::expected<cropsight::core::DetectionResult,
                                             cropsight::core::Error>& result) {
        std::cout << paths[i] << ": ";
        if (!result) {
          ++failures;
          std::cout << "\n";
          std::cerr << cropsight::core::describe(result.error()) << "\n";
          return;
        }
        std::cout << format_result(*result);
      });
  return failures == 0 ? 0 : 1;
}

int run_learn(cropsight::app::DetectionService& service, const std::vector<std::string>& args) {
  if (args.empty()) {
    std::cerr << "learn: missing label\n";
    return 1;
  }
  const std::string label = args.front();
  std::vector<cropsight::core::Image> images;
  if (!load_images(std::vector<std::string>(args.begin() + 1, args.end()), images)) return 1;

  auto prototype = service.learn(label, images);
  if (!prototype) {
    std::cerr << "learn: " << cropsight::core::describe(prototype.error()) << "\n";
    return 1;
  }
  std::cout << "learned " << prototype->label << " from " << prototype->sample_count
            << " images (dim=" << prototype->vector.size() << ")\n";
  return 0;
}

int run_list(const cropsight::app::DetectionService& service) {
  const auto prototypes = service.list_prototypes();
  std::cout << prototypes.size() << " classes\n";
  for (const auto& p : prototypes) {
    const std::time_t t = std::chrono::system_clock::to_time_t(p.created_at);
    std::tm tm{};
    gmtime_r(&t, &tm);
    std::cout << "  " << p.label << " samples=" << p.sample_count
              << " accuracy=" << p.estimated_accuracy
              << " created=" << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ") << "\n";
  }
  return 0;
}

int run_health(const cropsight::app::DetectionService& service) {
  const auto h = service.health();
  std::cout << "embedding_backend=" << h.embedding_backend
            << " ready=" << (h.embedding_ready ? "yes" : "no") << " dim=" << h.embedding_dim
            << " classes=" << h.known_classes
            << " enrichment=" << (h.enrichment_enabled ? "on" : "off") << "\n"
            << "providers:";
  for (const auto& id : h.providers) std::cout << " " << id;
  std::cout << "\n";
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string config_path;
  std::string backend_override;  // "mock" or "onnx"
  std::string model_override;
  std::vector<std::string> positional;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--backend" && i + 1 < argc) {
      backend_override = argv[++i];
    } else if (arg == "--model" && i + 1 < argc) {
      model_override = argv[++i];
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      positional.push_back(arg);
    }
  }
  if (positional.empty()) {
    print_usage();
    return 1;
  }

  cropsight::app::ServiceConfig cfg;
  try {
    cfg = config_path.empty() ? cropsight::app::default_config()
                              : cropsight::app::load_config(config_path);
  } catch (const std::invalid_argument& e) {
    std::cerr << e.what() << "\n";
    return 1;
  }
  cropsight::app::apply_env_overrides(cfg);

  if (!backend_override.empty()) {
    if (backend_override == "mock") {
      cfg.embedding_backend = cropsight::app::EmbeddingBackendType::Mock;
    } else if (backend_override == "onnx") {
      cfg.embedding_backend = cropsight::app::EmbeddingBackendType::Onnx;
    } else {
      std::cerr << "Unknown --backend " << backend_override << " (use mock or onnx)\n";
      return 1;
    }
  }
  if (!model_override.empty()) {
    cfg.model_path = model_override;
  }

  std::unique_ptr<cropsight::app::DetectionService> service;
  try {
    service = cropsight::app::build_service(cfg);
  } catch (const std::exception& e) {
    std::cerr << "Failed to start: " << e.what() << "\n";
    return 1;
  }

  const std::string command = positional.front();
  const std::vector<std::string> args(positional.begin() + 1, positional.end());
  if (command == "classify") return run_classify(*service, args);
  if (command == "learn") return run_learn(*service, args);
  if (command == "list") return run_list(*service);
  if (command == "health") return run_health(*service);

  std::cerr << "Unknown command " << command << "\n";
  print_usage();
  return 1;
}
