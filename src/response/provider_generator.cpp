#include "voxrelay/response/provider_generator.hpp"

#include "voxrelay/common/fs.hpp"
#include "voxrelay/common/json_util.hpp"
#include "voxrelay/events/value.hpp"

#include <charconv>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <sstream>
#include <thread>

namespace voxrelay::response {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(20);

/// `error.message` of an OpenAI-style error document, or a bare string `error`.
std::optional<std::string> error_message(const events::Value &document) {
  if (!document.is_object()) {
    return std::nullopt;
  }
  const auto *error = document.as_object().find("error");
  if (error == nullptr || error->is_null()) {
    return std::nullopt;
  }
  if (error->is_string()) {
    return error->as_string();
  }
  if (error->is_object()) {
    const auto *message = error->as_object().find("message");
    if (message != nullptr && message->is_string()) {
      return message->as_string();
    }
  }
  return std::string("upstream reported an error");
}

std::string error_detail(const std::string &body) {
  if (const auto parsed = events::parse_json(body); parsed.ok()) {
    if (auto message = error_message(parsed.value()); message.has_value()) {
      return *message;
    }
  }
  if (body.size() > 256) {
    return body.substr(0, 256) + "...";
  }
  return body;
}

/// Yields a single failure; used when a request cannot even be issued.
class FailedFragmentStream final : public IFragmentStream {
public:
  explicit FailedFragmentStream(std::string message) : message_(std::move(message)) {}

  common::Result<std::optional<std::string>> next(const common::CancellationToken &) override {
    return common::Result<std::optional<std::string>>::failure(message_);
  }

private:
  std::string message_;
};

/// Runs the HTTP request on its own thread and hands deltas over through a queue,
/// so the consumer can keep watching its cancellation token while waiting.
class ProviderFragmentStream final : public IFragmentStream {
public:
  ProviderFragmentStream(std::shared_ptr<HttpClient> http_client, std::string url,
                         HttpHeaders headers, std::string body, std::uint64_t timeout_ms)
      : http_client_(std::move(http_client)), url_(std::move(url)), headers_(std::move(headers)),
        body_(std::move(body)), timeout_ms_(timeout_ms) {}

  ~ProviderFragmentStream() override {
    abandon_.cancel();
    if (worker_.joinable()) {
      worker_.join();
    }
  }

  common::Result<std::optional<std::string>> next(const common::CancellationToken &token) override {
    using NextResult = common::Result<std::optional<std::string>>;
    if (!worker_.joinable()) {
      worker_ = std::thread([this] { run(); });
    }

    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
      if (!pending_.empty()) {
        std::string fragment = std::move(pending_.front());
        pending_.pop_front();
        return NextResult::success(std::move(fragment));
      }
      if (finished_) {
        if (error_.has_value()) {
          return NextResult::failure(*error_);
        }
        return NextResult::success(std::nullopt);
      }
      if (token.cancelled()) {
        return NextResult::success(std::nullopt);
      }
      cv_.wait_for(lock, kPollInterval);
    }
  }

private:
  void push(std::string fragment) {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      pending_.push_back(std::move(fragment));
    }
    cv_.notify_all();
  }

  void run() {
    SseDecoder decoder;
    bool saw_done = false;
    std::size_t produced = 0;
    std::optional<std::string> stream_error;

    const SseDecoder::EventCallback on_event = [&](const std::string &data) {
      if (saw_done || stream_error.has_value()) {
        return;
      }
      if (common::trim(data) == "[DONE]") {
        saw_done = true;
        return;
      }
      auto delta = parse_openai_sse_event_delta(data);
      if (!delta.ok()) {
        stream_error = delta.error();
        return;
      }
      if (delta.value().empty()) {
        return;
      }
      ++produced;
      push(delta.value());
    };

    const auto response = http_client_->post_json_stream(
        url_, headers_, body_, timeout_ms_,
        [&](const std::string_view bytes) { decoder.feed(bytes, on_event); }, abandon_.token());
    decoder.finish(on_event);

    std::optional<std::string> error;
    if (!response.aborted) {
      if (const auto status = check_http_status(response); !status.ok()) {
        error = status.error();
      } else if (stream_error.has_value()) {
        error = ProviderError{.code = ProviderErrorCode::ApiError, .message = *stream_error}
                    .to_string();
      } else if (produced == 0 && !saw_done) {
        error = ProviderError{.code = ProviderErrorCode::InvalidResponse,
                              .message = "stream ended without content"}
                    .to_string();
      }
    }

    {
      std::lock_guard<std::mutex> lock(mutex_);
      finished_ = true;
      error_ = std::move(error);
    }
    cv_.notify_all();
  }

  std::shared_ptr<HttpClient> http_client_;
  std::string url_;
  HttpHeaders headers_;
  std::string body_;
  std::uint64_t timeout_ms_;

  common::CancellationSource abandon_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::string> pending_;
  bool finished_ = false;
  std::optional<std::string> error_;
  std::thread worker_;
};

} // namespace

std::string ProviderError::to_string() const {
  std::ostringstream stream;
  stream << "provider error [";
  switch (code) {
  case ProviderErrorCode::ApiError:
    stream << "api";
    break;
  case ProviderErrorCode::NetworkError:
    stream << "network";
    break;
  case ProviderErrorCode::AuthError:
    stream << "auth";
    break;
  case ProviderErrorCode::RateLimitError:
    stream << "rate_limit";
    break;
  case ProviderErrorCode::ModelNotFound:
    stream << "model_not_found";
    break;
  case ProviderErrorCode::InvalidResponse:
    stream << "invalid_response";
    break;
  case ProviderErrorCode::Timeout:
    stream << "timeout";
    break;
  }
  stream << "]";
  if (status != 0) {
    stream << " status=" << status;
  }
  if (retry_after.has_value()) {
    stream << " retry_after=" << *retry_after;
  }
  if (!message.empty()) {
    stream << " " << message;
  }
  return stream.str();
}

common::Status check_http_status(const HttpResponse &response) {
  if (response.timeout) {
    return common::Status::error(
        ProviderError{.code = ProviderErrorCode::Timeout, .message = "request timed out"}
            .to_string());
  }
  if (response.network_error) {
    return common::Status::error(ProviderError{.code = ProviderErrorCode::NetworkError,
                                               .message = response.network_error_message}
                                     .to_string());
  }

  const std::uint16_t status = response.status;
  if (status >= 200 && status < 300) {
    return common::Status::success();
  }

  ProviderError error{.status = status, .message = error_detail(response.body)};
  if (status == 401 || status == 403) {
    error.code = ProviderErrorCode::AuthError;
  } else if (status == 404) {
    error.code = ProviderErrorCode::ModelNotFound;
  } else if (status == 429) {
    error.code = ProviderErrorCode::RateLimitError;
    if (const auto it = response.headers.find("retry-after"); it != response.headers.end()) {
      std::uint64_t seconds = 0;
      const auto &text = it->second;
      const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
      if (ec == std::errc() && ptr == text.data() + text.size()) {
        error.retry_after = seconds;
      }
    }
  }
  return common::Status::error(error.to_string());
}

void SseDecoder::feed(const std::string_view bytes, const EventCallback &on_event) {
  line_buffer_.append(bytes);
  std::size_t line_end = std::string::npos;
  while ((line_end = line_buffer_.find('\n')) != std::string::npos) {
    std::string line = line_buffer_.substr(0, line_end);
    line_buffer_.erase(0, line_end + 1);
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }

    if (line.empty()) {
      if (!event_data_.empty()) {
        on_event(event_data_);
        event_data_.clear();
      }
      continue;
    }
    if (!common::starts_with(line, "data:")) {
      continue;
    }

    std::string payload = line.substr(5);
    if (!payload.empty() && payload.front() == ' ') {
      payload.erase(payload.begin());
    }
    if (!event_data_.empty()) {
      event_data_.push_back('\n');
    }
    event_data_ += payload;
  }
}

void SseDecoder::finish(const EventCallback &on_event) {
  if (!line_buffer_.empty()) {
    feed("\n", on_event);
  }
  if (!event_data_.empty()) {
    on_event(event_data_);
    event_data_.clear();
  }
}

common::Result<std::string> parse_openai_sse_event_delta(const std::string &event_data) {
  const std::string trimmed = common::trim(event_data);
  if (trimmed.empty() || trimmed == "[DONE]") {
    return common::Result<std::string>::success("");
  }

  const auto parsed = events::parse_json(trimmed);
  if (!parsed.ok()) {
    return common::Result<std::string>::failure("malformed stream event: " + parsed.error());
  }
  if (auto message = error_message(parsed.value()); message.has_value()) {
    return common::Result<std::string>::failure(*message);
  }
  if (!parsed.value().is_object()) {
    return common::Result<std::string>::success("");
  }

  const auto *choices = parsed.value().as_object().find("choices");
  if (choices == nullptr || !choices->is_array() || choices->as_array().empty() ||
      !choices->as_array().front().is_object()) {
    return common::Result<std::string>::success("");
  }
  const auto *delta = choices->as_array().front().as_object().find("delta");
  if (delta == nullptr || !delta->is_object()) {
    return common::Result<std::string>::success("");
  }
  const auto *content = delta->as_object().find("content");
  if (content == nullptr || !content->is_string()) {
    return common::Result<std::string>::success("");
  }
  return common::Result<std::string>::success(content->as_string());
}

ProviderResponseGenerator::ProviderResponseGenerator(ProviderGeneratorConfig config,
                                                     std::shared_ptr<HttpClient> http_client)
    : config_(std::move(config)), http_client_(std::move(http_client)) {
  while (!config_.base_url.empty() && config_.base_url.back() == '/') {
    config_.base_url.pop_back();
  }
}

HttpHeaders ProviderResponseGenerator::build_headers() const {
  HttpHeaders headers = {
      {"Content-Type", "application/json"},
      {"Accept", "text/event-stream"},
  };
  if (!config_.api_key.empty()) {
    headers["Authorization"] = "Bearer " + config_.api_key;
  }
  for (const auto &[key, value] : config_.extra_headers) {
    headers[key] = value;
  }
  return headers;
}

std::string ProviderResponseGenerator::build_body(const GenerationInput &input) const {
  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(config_.model) << "\",";
  body << "\"messages\":[";
  bool first = true;
  const auto append_message = [&](const std::string_view role, const std::string &content) {
    if (!first) {
      body << ',';
    }
    first = false;
    body << "{\"role\":\"" << role << "\",\"content\":\"" << common::json_escape(content)
         << "\"}";
  };

  if (!common::trim(input.system_prompt).empty()) {
    append_message("system", input.system_prompt);
  }
  std::size_t skip = 0;
  if (config_.max_history_turns > 0 && input.history.size() > config_.max_history_turns) {
    skip = input.history.size() - config_.max_history_turns;
  }
  for (std::size_t i = skip; i < input.history.size(); ++i) {
    const auto &entry = input.history[i];
    append_message(conversation::role_name(entry.role), entry.text);
  }
  append_message("user", input.utterance);
  body << "],";
  body << "\"temperature\":" << config_.temperature << ",";
  body << "\"stream\":true";
  body << "}";
  return body.str();
}

std::unique_ptr<IFragmentStream> ProviderResponseGenerator::generate(const GenerationInput &input) {
  if (config_.require_api_key && config_.api_key.empty()) {
    return std::make_unique<FailedFragmentStream>(
        ProviderError{.code = ProviderErrorCode::AuthError, .message = "missing API key"}
            .to_string());
  }
  if (http_client_ == nullptr) {
    return std::make_unique<FailedFragmentStream>(
        ProviderError{.code = ProviderErrorCode::NetworkError, .message = "no HTTP client"}
            .to_string());
  }
  return std::make_unique<ProviderFragmentStream>(http_client_, endpoint(), build_headers(),
                                                  build_body(input), config_.timeout_ms);
}

} // namespace voxrelay::response
