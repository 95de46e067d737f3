#pragma once

#include <cropsight/core/error.hpp>
#include <chrono>
#include <expected>
#include <stop_token>
#include <string>
#include <utility>
#include <vector>

namespace cropsight::detection {

struct HttpRequest {
  std::string base_url;  // scheme://host[:port], e.g. "https://api.groq.com"
  std::string path;      // e.g. "/openai/v1/chat/completions"
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  std::string content_type{"application/json"};
  std::chrono::milliseconds timeout{30000};
};

struct HttpResponse {
  int status{0};
  std::string body;
};

/// Blocking HTTP POST. Passed to every external provider at construction so tests
/// can substitute a fake. A transport failure (DNS, TLS, socket, cancelled) is
/// ProviderFailed; any HTTP status, including errors, is a successful response.
class IHttpTransport {
 public:
  virtual ~IHttpTransport() = default;

  [[nodiscard]] virtual std::expected<HttpResponse, core::Error> post(
      const HttpRequest& request, std::stop_token stop) = 0;
};

/// cpp-httplib client. A stop request aborts the in-flight socket.
class HttplibTransport : public IHttpTransport {
 public:
  [[nodiscard]] std::expected<HttpResponse, core::Error> post(const HttpRequest& request,
                                                              std::stop_token stop) override;
};

}  // namespace cropsight::detection
