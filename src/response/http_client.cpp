#include "voxrelay/response/http_client.hpp"

#include "voxrelay/common/fs.hpp"

#include <curl/curl.h>

#include <optional>

namespace voxrelay::response {

namespace {

constexpr const char *kUserAgent = "VoxRelay/0.1";

struct TransferContext {
  CURL *curl = nullptr;
  HttpResponse *response = nullptr;
  const StreamChunkCallback *on_chunk = nullptr;
  const common::CancellationToken *cancel = nullptr;
  std::optional<bool> forward;
};

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *context = static_cast<TransferContext *>(userdata);
  if (context->cancel != nullptr && context->cancel->cancelled()) {
    return 0;
  }

  if (context->on_chunk == nullptr || !*context->on_chunk) {
    context->response->body.append(ptr, total);
    return total;
  }

  if (!context->forward.has_value()) {
    long status = 0;
    curl_easy_getinfo(context->curl, CURLINFO_RESPONSE_CODE, &status);
    context->forward = status >= 200 && status < 300;
  }
  if (*context->forward) {
    (*context->on_chunk)(std::string_view(ptr, total));
  } else {
    context->response->body.append(ptr, total);
  }
  return total;
}

int progress_callback(void *userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
  const auto *context = static_cast<TransferContext *>(userdata);
  if (context->cancel != nullptr && context->cancel->cancelled()) {
    return 1;
  }
  return 0;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  const std::string header(buffer, total);
  auto *headers = static_cast<HttpHeaders *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    (*headers)[common::to_lower(common::trim(header.substr(0, separator)))] =
        common::trim(header.substr(separator + 1));
  }
  return total;
}

HttpResponse execute_post(const std::string &url, const HttpHeaders &headers,
                          const std::string &body, const std::uint64_t timeout_ms,
                          const StreamChunkCallback *on_chunk,
                          const common::CancellationToken *cancel) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  TransferContext context{
      .curl = curl, .response = &response, .on_chunk = on_chunk, .cancel = cancel};

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(body.size()));
  if (cancel != nullptr) {
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &context);
  }

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  response.status = static_cast<std::uint16_t>(status);
  if (code != CURLE_OK) {
    if (cancel != nullptr && cancel->cancelled()) {
      response.aborted = true;
    } else {
      response.network_error = true;
      response.network_error_message = curl_easy_strerror(code);
      response.timeout = code == CURLE_OPERATION_TIMEDOUT;
    }
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

} // namespace

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body, const std::uint64_t timeout_ms) {
  return execute_post(url, headers, body, timeout_ms, nullptr, nullptr);
}

HttpResponse CurlHttpClient::post_json_stream(const std::string &url, const HttpHeaders &headers,
                                              const std::string &body,
                                              const std::uint64_t timeout_ms,
                                              const StreamChunkCallback &on_chunk,
                                              const common::CancellationToken &cancel) {
  return execute_post(url, headers, body, timeout_ms, &on_chunk, &cancel);
}

} // namespace voxrelay::response
