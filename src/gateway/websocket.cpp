#include "voxrelay/gateway/websocket.hpp"

#include "voxrelay/common/fs.hpp"
#include "voxrelay/events/event.hpp"
#include "voxrelay/gateway/protocol.hpp"
#include "voxrelay/observability/global.hpp"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/sha.h>
#include <openssl/ssl.h>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <limits>
#include <sstream>
#include <vector>

namespace voxrelay::gateway {

namespace {

constexpr std::size_t kMaxHandshakeBytes = 8 * 1024;
constexpr std::size_t kMaxFramePayloadBytes = 1024 * 1024;
constexpr int kListenBacklog = 64;
constexpr std::string_view kWebSocketGuid = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

constexpr std::uint8_t kOpText = 0x1u;
constexpr std::uint8_t kOpBinary = 0x2u;
constexpr std::uint8_t kOpClose = 0x8u;
constexpr std::uint8_t kOpPing = 0x9u;
constexpr std::uint8_t kOpPong = 0xAu;

ssize_t write_bytes(const int fd, SSL *ssl, const std::uint8_t *data, const std::size_t size) {
  if (ssl != nullptr) {
    return static_cast<ssize_t>(SSL_write(ssl, data, static_cast<int>(size)));
  }
  return send(fd, data, size, MSG_NOSIGNAL);
}

ssize_t read_bytes(const int fd, SSL *ssl, std::uint8_t *data, const std::size_t size) {
  if (ssl != nullptr) {
    return static_cast<ssize_t>(SSL_read(ssl, data, static_cast<int>(size)));
  }
  return recv(fd, data, size, 0);
}

bool send_all(const int fd, SSL *ssl, const std::uint8_t *data, std::size_t size) {
  std::size_t sent = 0;
  while (sent < size) {
    const ssize_t n = write_bytes(fd, ssl, data + sent, size - sent);
    if (n <= 0) {
      return false;
    }
    sent += static_cast<std::size_t>(n);
  }
  return true;
}

bool recv_exact(const int fd, SSL *ssl, std::uint8_t *data, std::size_t size) {
  std::size_t received = 0;
  while (received < size) {
    const ssize_t n = read_bytes(fd, ssl, data + received, size - received);
    if (n <= 0) {
      return false;
    }
    received += static_cast<std::size_t>(n);
  }
  return true;
}

std::string lower_trimmed(const std::string &value) {
  return common::to_lower(common::trim(value));
}

std::string normalize_bind_host(const std::string &host) {
  const std::string lowered = lower_trimmed(host);
  if (lowered == "localhost" || lowered == "::1" || lowered == "[::1]") {
    return "127.0.0.1";
  }
  return common::trim(host);
}

std::unordered_map<std::string, std::string> parse_headers(const std::string &request) {
  std::unordered_map<std::string, std::string> headers;
  std::istringstream lines(request);
  std::string line;
  bool first = true;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      break;
    }
    if (first) {
      headers[":request-line"] = line;
      first = false;
      continue;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    headers[lower_trimmed(line.substr(0, colon))] = common::trim(line.substr(colon + 1));
  }
  return headers;
}

std::string websocket_accept(const std::string &client_key) {
  const std::string source = client_key + std::string(kWebSocketGuid);
  std::array<unsigned char, SHA_DIGEST_LENGTH> digest{};
  SHA1(reinterpret_cast<const unsigned char *>(source.data()), source.size(), digest.data());

  const int output_len = 4 * static_cast<int>((digest.size() + 2) / 3);
  std::string output(static_cast<std::size_t>(output_len), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()), digest.data(),
                  static_cast<int>(digest.size()));
  return output;
}

std::string openssl_error_string() {
  const auto code = ERR_get_error();
  if (code == 0) {
    return "unknown openssl error";
  }
  std::array<char, 256> buffer{};
  ERR_error_string_n(code, buffer.data(), buffer.size());
  return std::string(buffer.data());
}

bool send_http_response(const int fd, SSL *ssl, const int status, const std::string &status_text,
                        const std::vector<std::pair<std::string, std::string>> &headers,
                        const std::string &body = "") {
  std::ostringstream response;
  response << "HTTP/1.1 " << status << " " << status_text << "\r\n";
  for (const auto &[k, v] : headers) {
    response << k << ": " << v << "\r\n";
  }
  if (status != 101) {
    response << "Content-Length: " << body.size() << "\r\n";
    response << "Connection: close\r\n";
  }
  response << "\r\n";
  response << body;
  const std::string text = response.str();
  return send_all(fd, ssl, reinterpret_cast<const std::uint8_t *>(text.data()), text.size());
}

bool send_json_response(const int fd, SSL *ssl, const int status, const std::string &status_text,
                        const std::string &body) {
  return send_http_response(fd, ssl, status, status_text, {{"Content-Type", "application/json"}},
                            body);
}

/// Client frames must be masked and unfragmented.
bool read_next_frame(const int fd, SSL *ssl, std::uint8_t &opcode, std::string &payload) {
  std::array<std::uint8_t, 2> header{};
  if (!recv_exact(fd, ssl, header.data(), header.size())) {
    return false;
  }

  const bool fin = (header[0] & 0x80u) != 0;
  opcode = static_cast<std::uint8_t>(header[0] & 0x0Fu);
  const bool masked = (header[1] & 0x80u) != 0;
  std::uint64_t payload_len = static_cast<std::uint64_t>(header[1] & 0x7Fu);

  if (!fin) {
    return false;
  }

  if (payload_len == 126u) {
    std::array<std::uint8_t, 2> ext{};
    if (!recv_exact(fd, ssl, ext.data(), ext.size())) {
      return false;
    }
    payload_len = (static_cast<std::uint64_t>(ext[0]) << 8u) | static_cast<std::uint64_t>(ext[1]);
  } else if (payload_len == 127u) {
    std::array<std::uint8_t, 8> ext{};
    if (!recv_exact(fd, ssl, ext.data(), ext.size())) {
      return false;
    }
    payload_len = 0;
    for (const auto byte : ext) {
      payload_len = (payload_len << 8u) | static_cast<std::uint64_t>(byte);
    }
  }

  if (!masked || payload_len > kMaxFramePayloadBytes ||
      payload_len > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max())) {
    return false;
  }

  std::array<std::uint8_t, 4> mask{};
  if (!recv_exact(fd, ssl, mask.data(), mask.size())) {
    return false;
  }

  std::vector<std::uint8_t> bytes(static_cast<std::size_t>(payload_len));
  if (!bytes.empty() && !recv_exact(fd, ssl, bytes.data(), bytes.size())) {
    return false;
  }

  for (std::size_t i = 0; i < bytes.size(); ++i) {
    bytes[i] ^= mask[i % mask.size()];
  }

  payload.assign(reinterpret_cast<const char *>(bytes.data()), bytes.size());
  return true;
}

std::vector<std::uint8_t> encode_frame(const std::uint8_t opcode, const std::string &payload) {
  std::vector<std::uint8_t> frame;
  frame.reserve(payload.size() + 16);
  frame.push_back(static_cast<std::uint8_t>(0x80u | (opcode & 0x0Fu)));

  const auto size = payload.size();
  if (size <= 125u) {
    frame.push_back(static_cast<std::uint8_t>(size));
  } else if (size <= 65535u) {
    frame.push_back(126u);
    frame.push_back(static_cast<std::uint8_t>((size >> 8u) & 0xFFu));
    frame.push_back(static_cast<std::uint8_t>(size & 0xFFu));
  } else {
    frame.push_back(127u);
    for (int shift = 56; shift >= 0; shift -= 8) {
      frame.push_back(static_cast<std::uint8_t>((size >> static_cast<std::size_t>(shift)) & 0xFFu));
    }
  }

  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

std::string close_payload(const std::uint16_t code) {
  std::string payload;
  payload.push_back(static_cast<char>((code >> 8u) & 0xFFu));
  payload.push_back(static_cast<char>(code & 0xFFu));
  return payload;
}

/// Request target without its query string, e.g. "/ws?token=1" -> "/ws".
std::string request_path(const std::string &request_line, std::string &method) {
  std::istringstream parts(request_line);
  std::string target;
  parts >> method >> target;
  const auto query = target.find('?');
  if (query != std::string::npos) {
    target.resize(query);
  }
  return target;
}

std::string peer_name(const sockaddr_in &addr) {
  std::array<char, INET_ADDRSTRLEN> host{};
  if (inet_ntop(AF_INET, &addr.sin_addr, host.data(), host.size()) == nullptr) {
    return "unknown";
  }
  return std::string(host.data()) + ":" + std::to_string(ntohs(addr.sin_port));
}

} // namespace

ClientConnection::ClientConnection(const int fd, SSL *ssl, std::string peer)
    : fd_(fd), ssl_(ssl), peer_(std::move(peer)) {}

ClientConnection::~ClientConnection() { close_socket(); }

common::Status ClientConnection::send_frame(const std::uint8_t opcode, const std::string &payload) {
  const auto frame = encode_frame(opcode, payload);
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (closed_) {
    return common::Status::error("connection closed");
  }
  if (!send_all(fd_, ssl_, frame.data(), frame.size())) {
    return common::Status::error("websocket write failed");
  }
  return common::Status::success();
}

common::Status ClientConnection::send_text(const std::string &payload) {
  return send_frame(kOpText, payload);
}

common::Status ClientConnection::send_urgent(const events::OutboundEvent &event) {
  return send_text(event.to_json());
}

common::Status ClientConnection::send_audio(const tts::AudioChunk &chunk) {
  if (chunk.bytes.empty()) {
    return common::Status::success();
  }
  return send_frame(kOpBinary,
                    std::string(reinterpret_cast<const char *>(chunk.bytes.data()),
                                chunk.bytes.size()));
}

void ClientConnection::shutdown_socket() {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (!closed_ && fd_ >= 0) {
    ::shutdown(fd_, SHUT_RDWR);
  }
}

void ClientConnection::close_socket() {
  // Unblock a writer stuck on a slow peer before taking the write lock.
  shutdown_socket();
  std::lock_guard<std::mutex> write_lock(write_mutex_);
  std::lock_guard<std::mutex> state_lock(state_mutex_);
  if (closed_) {
    return;
  }
  closed_ = true;
  if (ssl_ != nullptr) {
    SSL_shutdown(ssl_);
    SSL_free(ssl_);
    ssl_ = nullptr;
  }
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

GatewayServer::GatewayServer() = default;

GatewayServer::~GatewayServer() { stop(); }

common::Status GatewayServer::start(const GatewayOptions &options) {
  if (running_) {
    return common::Status::error("gateway already running");
  }
  if (common::trim(options.host).empty()) {
    return common::Status::error("gateway host is empty");
  }
  if (options.path.empty() || options.path.front() != '/') {
    return common::Status::error("gateway path must start with '/'");
  }

  listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
  if (listen_fd_ < 0) {
    return common::Status::error("failed to create gateway listen socket");
  }
  int reuse = 1;
  (void)setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(options.port);
  const std::string bind_host = normalize_bind_host(options.host);
  if (inet_pton(AF_INET, bind_host.c_str(), &addr.sin_addr) != 1) {
    ::close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("invalid gateway bind host: " + options.host);
  }
  if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
    const std::string message = std::strerror(errno);
    ::close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("gateway bind failed: " + message);
  }
  if (listen(listen_fd_, kListenBacklog) != 0) {
    const std::string message = std::strerror(errno);
    ::close(listen_fd_);
    listen_fd_ = -1;
    return common::Status::error("gateway listen failed: " + message);
  }

  sockaddr_in actual{};
  socklen_t actual_len = sizeof(actual);
  if (getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&actual), &actual_len) == 0) {
    bound_port_ = ntohs(actual.sin_port);
  } else {
    bound_port_ = options.port;
  }

  options_ = options;
  if (options_.tls_enabled) {
    const auto fail_tls = [this](const std::string &message) {
      if (tls_ctx_ != nullptr) {
        SSL_CTX_free(tls_ctx_);
        tls_ctx_ = nullptr;
      }
      ::close(listen_fd_);
      listen_fd_ = -1;
      bound_port_ = 0;
      return common::Status::error(message);
    };

    if (options_.tls_cert_file.empty() || options_.tls_key_file.empty()) {
      return fail_tls("gateway TLS requires cert and key file paths");
    }
    tls_ctx_ = SSL_CTX_new(TLS_server_method());
    if (tls_ctx_ == nullptr) {
      return fail_tls("failed to initialize gateway TLS context: " + openssl_error_string());
    }
    SSL_CTX_set_min_proto_version(tls_ctx_, TLS1_2_VERSION);
    if (SSL_CTX_use_certificate_file(tls_ctx_, options_.tls_cert_file.c_str(), SSL_FILETYPE_PEM) <=
        0) {
      return fail_tls("failed loading gateway TLS certificate: " + openssl_error_string());
    }
    if (SSL_CTX_use_PrivateKey_file(tls_ctx_, options_.tls_key_file.c_str(), SSL_FILETYPE_PEM) <=
        0) {
      return fail_tls("failed loading gateway TLS private key: " + openssl_error_string());
    }
    if (SSL_CTX_check_private_key(tls_ctx_) != 1) {
      return fail_tls("gateway TLS private key does not match certificate: " +
                      openssl_error_string());
    }
  }

  running_ = true;
  accept_thread_ = std::thread([this]() { accept_loop(); });
  std::cerr << "[gateway] listening on " << bind_host << ":" << bound_port_ << options_.path
            << (tls_ctx_ != nullptr ? " (tls)" : "") << "\n";
  return common::Status::success();
}

void GatewayServer::stop() {
  if (!running_ && listen_fd_ < 0 && tls_ctx_ == nullptr) {
    return;
  }
  running_ = false;

  if (listen_fd_ >= 0) {
    shutdown(listen_fd_, SHUT_RDWR);
    ::close(listen_fd_);
    listen_fd_ = -1;
  }
  if (accept_thread_.joinable()) {
    accept_thread_.join();
  }

  {
    std::unique_lock<std::mutex> lock(clients_mutex_);
    for (const auto &[fd, client] : clients_) {
      (void)fd;
      client->shutdown_socket();
    }
    // Client threads tear their sessions down and deregister themselves.
    clients_cv_.wait(lock, [this]() { return clients_.empty(); });
  }

  if (tls_ctx_ != nullptr) {
    SSL_CTX_free(tls_ctx_);
    tls_ctx_ = nullptr;
  }
  bound_port_ = 0;
  std::cerr << "[gateway] stopped\n";
}

bool GatewayServer::is_running() const { return running_.load(); }

std::uint16_t GatewayServer::port() const { return bound_port_; }

GatewayStats GatewayServer::stats() const {
  std::lock_guard<std::mutex> lock(clients_mutex_);
  return GatewayStats{.open_connections = clients_.size(),
                      .active_sessions = active_sessions_,
                      .sessions_served = sessions_served_};
}

void GatewayServer::accept_loop() {
  while (running_) {
    sockaddr_in client_addr{};
    socklen_t len = sizeof(client_addr);
    const int client_fd = accept(listen_fd_, reinterpret_cast<sockaddr *>(&client_addr), &len);
    if (client_fd < 0) {
      if (!running_) {
        break;
      }
      continue;
    }

    SSL *ssl = nullptr;
    if (tls_ctx_ != nullptr) {
      ssl = SSL_new(tls_ctx_);
      if (ssl == nullptr) {
        shutdown(client_fd, SHUT_RDWR);
        ::close(client_fd);
        continue;
      }
      SSL_set_fd(ssl, client_fd);
    }

    auto client = std::make_shared<ClientConnection>(client_fd, ssl, peer_name(client_addr));
    {
      std::lock_guard<std::mutex> lock(clients_mutex_);
      if (!running_) {
        break;
      }
      clients_[client_fd] = client;
    }
    std::thread([this, client]() { client_loop(client); }).detach();
  }
}

void GatewayServer::client_loop(const std::shared_ptr<ClientConnection> client) {
  const int fd = client->fd();
  SSL *ssl = client->ssl();
  if (ssl != nullptr && SSL_accept(ssl) <= 0) {
    release_client(fd);
    return;
  }

  std::string request;
  request.reserve(1024);
  std::array<char, 1024> buf{};
  while (request.size() < kMaxHandshakeBytes) {
    const ssize_t n = read_bytes(fd, ssl, reinterpret_cast<std::uint8_t *>(buf.data()),
                                 buf.size());
    if (n <= 0) {
      release_client(fd);
      return;
    }
    request.append(buf.data(), static_cast<std::size_t>(n));
    if (request.find("\r\n\r\n") != std::string::npos) {
      break;
    }
  }
  if (request.find("\r\n\r\n") == std::string::npos) {
    (void)send_json_response(fd, ssl, 400, "Bad Request", R"({"error":"invalid_request"})");
    release_client(fd);
    return;
  }

  const auto headers = parse_headers(request);
  const auto request_line_it = headers.find(":request-line");
  std::string method;
  const std::string path =
      request_line_it == headers.end() ? "" : request_path(request_line_it->second, method);
  if (method != "GET") {
    (void)send_json_response(fd, ssl, 405, "Method Not Allowed",
                             R"({"error":"method_not_allowed"})");
    release_client(fd);
    return;
  }
  if (path == "/health") {
    (void)send_json_response(fd, ssl, 200, "OK", health_body());
    release_client(fd);
    return;
  }
  if (path == "/" && path != options_.path) {
    (void)send_http_response(fd, ssl, 200, "OK", {{"Content-Type", "text/html; charset=utf-8"}},
                             index_page(options_.path));
    release_client(fd);
    return;
  }
  if (path != options_.path) {
    (void)send_json_response(fd, ssl, 404, "Not Found", R"({"error":"not_found"})");
    release_client(fd);
    return;
  }

  const auto upgrade_it = headers.find("upgrade");
  const auto connection_it = headers.find("connection");
  const auto version_it = headers.find("sec-websocket-version");
  const auto key_it = headers.find("sec-websocket-key");
  if (upgrade_it == headers.end() || connection_it == headers.end() ||
      version_it == headers.end() || key_it == headers.end() ||
      lower_trimmed(upgrade_it->second) != "websocket" ||
      common::to_lower(connection_it->second).find("upgrade") == std::string::npos ||
      common::trim(version_it->second) != "13") {
    (void)send_json_response(fd, ssl, 400, "Bad Request",
                             R"({"error":"missing_websocket_headers"})");
    release_client(fd);
    return;
  }

  std::size_t active = 0;
  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    if (active_sessions_ >= options_.max_connections) {
      active = 0;
    } else {
      active = ++active_sessions_;
      ++sessions_served_;
    }
  }
  if (active == 0) {
    (void)send_json_response(fd, ssl, 503, "Service Unavailable",
                             R"({"error":"too_many_connections"})");
    release_client(fd);
    return;
  }
  observability::record_active_sessions(active);

  if (send_http_response(fd, ssl, 101, "Switching Protocols",
                         {{"Upgrade", "websocket"},
                          {"Connection", "Upgrade"},
                          {"Sec-WebSocket-Accept",
                           websocket_accept(common::trim(key_it->second))}})) {
    const auto agent_it = headers.find("user-agent");
    serve_session(client, ConnectionInfo{.peer = client->peer(),
                                         .path = path,
                                         .user_agent = agent_it == headers.end()
                                                           ? ""
                                                           : agent_it->second});
  }

  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    active = --active_sessions_;
  }
  observability::record_active_sessions(active);
  release_client(fd);
}

void GatewayServer::serve_session(const std::shared_ptr<ClientConnection> &client,
                                  const ConnectionInfo &info) {
  if (!options_.session_factory) {
    (void)client->send_frame(kOpClose, close_payload(1011));
    return;
  }
  auto created = options_.session_factory(info, *client);
  if (!created.ok()) {
    observability::record_error("gateway", "session setup failed: " + created.error());
    (void)client->send_urgent(events::make_error(created.error(), true));
    (void)client->send_frame(kOpClose, close_payload(1011));
    return;
  }

  auto session = std::move(created.value());
  session->start();
  std::cerr << "[gateway] session " << session->id() << " opened peer=" << info.peer << "\n";

  while (running_) {
    std::uint8_t opcode = 0;
    std::string payload;
    if (!read_next_frame(client->fd(), client->ssl(), opcode, payload)) {
      break;
    }
    if (opcode == kOpClose) {
      (void)client->send_frame(kOpClose, payload.size() >= 2 ? payload.substr(0, 2)
                                                             : close_payload(1000));
      break;
    }
    if (opcode == kOpPing) {
      (void)client->send_frame(kOpPong, payload);
      continue;
    }
    if (opcode == kOpText) {
      handle_client_frame(*session, payload);
    }
    // Binary frames carry caller audio, which is not transcribed here.
  }

  // Disconnect cancels any turn in flight.
  session->close();
  std::cerr << "[gateway] session " << session->id() << " closed\n";
}

void GatewayServer::release_client(const int fd) {
  std::shared_ptr<ClientConnection> client;
  {
    std::lock_guard<std::mutex> lock(clients_mutex_);
    auto it = clients_.find(fd);
    if (it != clients_.end()) {
      client = it->second;
    }
  }
  if (client != nullptr) {
    client->close_socket();
  }
  // Notify under the lock: once the map is empty stop() may return and destroy us.
  std::lock_guard<std::mutex> lock(clients_mutex_);
  // The fd may already belong to a newer connection.
  if (auto it = clients_.find(fd); it != clients_.end() && it->second == client) {
    clients_.erase(it);
  }
  clients_cv_.notify_all();
}

} // namespace voxrelay::gateway
