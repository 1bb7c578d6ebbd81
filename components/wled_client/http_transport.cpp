#include "wled_client/http_transport.hpp"
#include <curl/curl.h>
#include <mutex>
#include <string>

namespace {

std::once_flag s_curl_init;

size_t append_body(char* data, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(data, size * nmemb);
  return size * nmemb;
}

HttpOutcome classify(CURLcode code) {
  switch (code) {
    case CURLE_OK:
      return HttpOutcome::Completed;
    case CURLE_OPERATION_TIMEDOUT:
      return HttpOutcome::Timeout;
    case CURLE_COULDNT_CONNECT:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_SEND_ERROR:
    case CURLE_RECV_ERROR:
    case CURLE_GOT_NOTHING:
      return HttpOutcome::ConnectFailed;
    default:
      return HttpOutcome::Failed;
  }
}

}  // namespace

std::string http_request_url(const HttpRequest& request) {
  const uint16_t port = request.port == 0 ? 80 : request.port;
  return "http://" + request.host + ":" + std::to_string(port) + request.path;
}

CurlHttpTransport::CurlHttpTransport() {
  std::call_once(s_curl_init, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpResponse CurlHttpTransport::perform(const HttpRequest& request) {
  HttpResponse response{};
  if (request.host.empty()) {
    response.error = "empty host";
    return response;
  }

  CURL* curl = curl_easy_init();
  if (!curl) {
    response.error = "curl_easy_init failed";
    return response;
  }

  const std::string url = http_request_url(request);
  char errbuf[CURL_ERROR_SIZE] = {0};
  curl_slist* headers = nullptr;

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
  curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.timeout_ms));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errbuf);
  if (request.method == HttpMethod::Post) {
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers);
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  }

  const CURLcode code = curl_easy_perform(curl);
  response.outcome = classify(code);
  if (code == CURLE_OK) {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
  } else {
    response.error = errbuf[0] != '\0' ? errbuf : curl_easy_strerror(code);
  }

  if (headers) {
    curl_slist_free_all(headers);
  }
  curl_easy_cleanup(curl);
  return response;
}
