#pragma once

#include "voxrelay/common/result.hpp"
#include "voxrelay/events/forwarder.hpp"
#include "voxrelay/session/session.hpp"
#include "voxrelay/tts/speech_sink.hpp"

#include <openssl/ssl.h>

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace voxrelay::gateway {

/// One accepted client socket. Serves as the session's urgent event channel (text
/// frames) and audio output (binary frames); writes are serialized.
class ClientConnection final : public events::IEventChannel, public tts::IAudioOutput {
public:
  ClientConnection(int fd, SSL *ssl, std::string peer);
  ~ClientConnection() override;

  ClientConnection(const ClientConnection &) = delete;
  ClientConnection &operator=(const ClientConnection &) = delete;

  [[nodiscard]] common::Status send_urgent(const events::OutboundEvent &event) override;
  [[nodiscard]] common::Status send_audio(const tts::AudioChunk &chunk) override;

  [[nodiscard]] common::Status send_text(const std::string &payload);
  [[nodiscard]] common::Status send_frame(std::uint8_t opcode, const std::string &payload);
  /// Unblocks a pending read; the owning thread still closes the socket.
  void shutdown_socket();
  void close_socket();

  [[nodiscard]] int fd() const { return fd_; }
  [[nodiscard]] SSL *ssl() const { return ssl_; }
  [[nodiscard]] const std::string &peer() const { return peer_; }

private:
  int fd_;
  SSL *ssl_;
  std::string peer_;
  std::mutex write_mutex_;
  std::mutex state_mutex_;
  bool closed_ = false;
};

struct ConnectionInfo {
  std::string peer;
  std::string path;
  std::string user_agent;
};

/// Builds the session for a freshly upgraded connection.
using SessionFactory = std::function<common::Result<std::unique_ptr<session::Session>>(
    const ConnectionInfo &, ClientConnection &)>;

struct GatewayOptions {
  std::string host = "127.0.0.1";
  /// 0 binds an ephemeral port; see port().
  std::uint16_t port = 8000;
  std::string path = "/ws";
  std::size_t max_connections = 64;
  bool tls_enabled = false;
  std::string tls_cert_file;
  std::string tls_key_file;
  SessionFactory session_factory;
};

struct GatewayStats {
  std::size_t open_connections = 0;
  std::size_t active_sessions = 0;
  std::uint64_t sessions_served = 0;
};

/// RFC 6455 server for voice sessions plus the HTTP liveness probe.
class GatewayServer {
public:
  GatewayServer();
  ~GatewayServer();

  GatewayServer(const GatewayServer &) = delete;
  GatewayServer &operator=(const GatewayServer &) = delete;

  [[nodiscard]] common::Status start(const GatewayOptions &options);
  /// Closes the listener and every connection, tearing their sessions down.
  void stop();

  [[nodiscard]] bool is_running() const;
  [[nodiscard]] std::uint16_t port() const;
  [[nodiscard]] GatewayStats stats() const;

private:
  void accept_loop();
  void client_loop(std::shared_ptr<ClientConnection> client);
  void serve_session(const std::shared_ptr<ClientConnection> &client, const ConnectionInfo &info);
  void release_client(int fd);

  GatewayOptions options_;
  std::atomic<bool> running_{false};
  int listen_fd_ = -1;
  std::thread accept_thread_;
  std::uint16_t bound_port_ = 0;
  SSL_CTX *tls_ctx_ = nullptr;

  mutable std::mutex clients_mutex_;
  std::condition_variable clients_cv_;
  std::unordered_map<int, std::shared_ptr<ClientConnection>> clients_;
  std::size_t active_sessions_ = 0;
  std::uint64_t sessions_served_ = 0;
};

} // namespace voxrelay::gateway
