#pragma once

#include "voxrelay/common/cancellation.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace voxrelay::response {

using HttpHeaders = std::unordered_map<std::string, std::string>;

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  HttpHeaders headers;
  bool timeout = false;
  bool network_error = false;
  bool aborted = false;
  std::string network_error_message;
};

using StreamChunkCallback = std::function<void(std::string_view)>;

class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) = 0;

  /// Streams the body of a successful (2xx) response to `on_chunk` as it arrives.
  /// Error bodies are collected in `HttpResponse::body` instead. Cancelling `cancel`
  /// aborts the transfer and sets `aborted`.
  [[nodiscard]] virtual HttpResponse
  post_json_stream(const std::string &url, const HttpHeaders &headers, const std::string &body,
                   std::uint64_t timeout_ms, const StreamChunkCallback &on_chunk,
                   const common::CancellationToken &cancel) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, std::uint64_t timeout_ms) override;
  [[nodiscard]] HttpResponse post_json_stream(const std::string &url, const HttpHeaders &headers,
                                              const std::string &body, std::uint64_t timeout_ms,
                                              const StreamChunkCallback &on_chunk,
                                              const common::CancellationToken &cancel) override;
};

} // namespace voxrelay::response
