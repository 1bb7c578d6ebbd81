#pragma once
#include <cstdint>
#include <string>

enum class HttpMethod {
  Get,
  Post,
};

enum class HttpOutcome {
  Completed,
  Timeout,
  ConnectFailed,
  Failed,
};

struct HttpRequest {
  HttpMethod method{HttpMethod::Get};
  std::string host{};
  uint16_t port{80};
  std::string path{"/"};
  std::string body{};
  uint32_t timeout_ms{5000};
};

struct HttpResponse {
  HttpOutcome outcome{HttpOutcome::Failed};
  long status{0};
  std::string body{};
  std::string error{};
};

// One blocking request/response exchange. Implementations must be safe to
// call from several threads at once; the subnet prober shares one instance
// across its workers.
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;
  virtual HttpResponse perform(const HttpRequest& request) = 0;
};

class CurlHttpTransport : public HttpTransport {
 public:
  CurlHttpTransport();
  HttpResponse perform(const HttpRequest& request) override;
};

std::string http_request_url(const HttpRequest& request);
