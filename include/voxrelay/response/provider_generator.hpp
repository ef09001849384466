#pragma once

#include "voxrelay/response/generator.hpp"
#include "voxrelay/response/http_client.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace voxrelay::response {

enum class ProviderErrorCode {
  ApiError,
  NetworkError,
  AuthError,
  RateLimitError,
  ModelNotFound,
  InvalidResponse,
  Timeout,
};

struct ProviderError {
  ProviderErrorCode code = ProviderErrorCode::ApiError;
  std::uint16_t status = 0;
  std::string message;
  std::optional<std::uint64_t> retry_after;

  [[nodiscard]] std::string to_string() const;
};

/// Maps transport failures and non-2xx statuses to a ProviderError message.
[[nodiscard]] common::Status check_http_status(const HttpResponse &response);

/// Incremental decoder for `text/event-stream` bodies. Joins multi-line `data:`
/// fields and reports one payload per blank-line-terminated event.
class SseDecoder {
public:
  using EventCallback = std::function<void(const std::string &)>;

  void feed(std::string_view bytes, const EventCallback &on_event);
  /// Flushes a trailing event that was not terminated by a blank line.
  void finish(const EventCallback &on_event);

private:
  std::string line_buffer_;
  std::string event_data_;
};

/// Text of choices[0].delta.content; empty for role-only, [DONE] or keep-alive
/// events. Fails when the event carries an `error` object.
[[nodiscard]] common::Result<std::string> parse_openai_sse_event_delta(const std::string &event_data);

struct ProviderGeneratorConfig {
  std::string name = "openai";
  std::string base_url = "https://api.openai.com/v1";
  std::string api_key;
  bool require_api_key = true;
  std::string model = "gpt-4o-mini";
  double temperature = 0.7;
  std::uint64_t timeout_ms = 30'000;
  std::size_t max_history_turns = 10;
  HttpHeaders extra_headers;
};

/// Streams replies from an OpenAI-compatible `/chat/completions` endpoint. Each
/// content delta becomes one fragment, unmodified.
class ProviderResponseGenerator final : public IResponseGenerator {
public:
  ProviderResponseGenerator(ProviderGeneratorConfig config, std::shared_ptr<HttpClient> http_client);

  [[nodiscard]] std::unique_ptr<IFragmentStream> generate(const GenerationInput &input) override;
  [[nodiscard]] std::string_view name() const override { return config_.name; }

  [[nodiscard]] std::string build_body(const GenerationInput &input) const;
  [[nodiscard]] HttpHeaders build_headers() const;
  [[nodiscard]] std::string endpoint() const { return config_.base_url + "/chat/completions"; }

private:
  ProviderGeneratorConfig config_;
  std::shared_ptr<HttpClient> http_client_;
};

} // namespace voxrelay::response
