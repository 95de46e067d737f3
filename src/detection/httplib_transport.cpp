#include <cropsight/detection/http_transport.hpp>
#include <httplib.h>
#include <string>

namespace cropsight::detection {

std::expected<HttpResponse, core::Error> HttplibTransport::post(const HttpRequest& request,
                                                                std::stop_token stop) {
  if (stop.stop_requested()) {
    return std::unexpected(core::make_error(core::ErrorCode::Timeout, "request cancelled"));
  }

  httplib::Client cli(request.base_url);
  if (!cli.is_valid()) {
    return std::unexpected(core::make_error(core::ErrorCode::ProviderFailed,
                                            "unsupported endpoint " + request.base_url));
  }
  cli.set_connection_timeout(request.timeout);
  cli.set_read_timeout(request.timeout);
  cli.set_write_timeout(request.timeout);

  httplib::Headers headers;
  for (const auto& [name, value] : request.headers) {
    headers.emplace(name, value);
  }

  std::stop_callback abort_on_stop(stop, [&cli]() { cli.stop(); });

  auto res = cli.Post(request.path, headers, request.body, request.content_type);
  if (!res) {
    if (stop.stop_requested()) {
      return std::unexpected(core::make_error(core::ErrorCode::Timeout, "request cancelled"));
    }
    return std::unexpected(core::make_error(
        core::ErrorCode::ProviderFailed,
        request.base_url + request.path + ": " + httplib::to_string(res.error())));
  }
  return HttpResponse{res->status, res->body};
}

}  // namespace cropsight::detection
