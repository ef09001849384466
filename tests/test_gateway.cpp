#include "test_framework.hpp"

#include "helpers/test_helpers.hpp"
#include "voxrelay/events/event.hpp"
#include "voxrelay/gateway/protocol.hpp"
#include "voxrelay/gateway/websocket.hpp"
#include "voxrelay/runtime/app.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <array>
#include <cstdint>

namespace {

namespace events = voxrelay::events;
namespace gateway = voxrelay::gateway;
namespace runtime = voxrelay::runtime;
namespace session = voxrelay::session;
namespace testing = voxrelay::testing;

constexpr const char *kClientKey = "dGhlIHNhbXBsZSBub25jZQ==";
constexpr const char *kExpectedAccept = "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=";

/// Minimal blocking client speaking HTTP/1.1 and masked RFC 6455 frames.
class RawClient {
public:
  explicit RawClient(const std::uint16_t port) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) {
      throw std::runtime_error("socket() failed");
    }
    timeval timeout{};
    timeout.tv_sec = 3;
    setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    if (::connect(fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0) {
      ::close(fd_);
      throw std::runtime_error("connect() failed");
    }
  }

  ~RawClient() {
    if (fd_ >= 0) {
      ::close(fd_);
    }
  }

  RawClient(const RawClient &) = delete;
  RawClient &operator=(const RawClient &) = delete;

  void send_raw(const std::string &bytes) {
    std::size_t sent = 0;
    while (sent < bytes.size()) {
      const ssize_t n = ::send(fd_, bytes.data() + sent, bytes.size() - sent, MSG_NOSIGNAL);
      if (n <= 0) {
        throw std::runtime_error("send() failed");
      }
      sent += static_cast<std::size_t>(n);
    }
  }

  /// Everything until the server closes the connection.
  std::string read_until_closed() {
    while (fill()) {
    }
    std::string out = std::move(buffer_);
    buffer_.clear();
    return out;
  }

  /// The response head, leaving any bytes after it buffered.
  std::string read_head() {
    std::size_t end = std::string::npos;
    while ((end = buffer_.find("\r\n\r\n")) == std::string::npos) {
      if (!fill()) {
        return "";
      }
    }
    std::string head = buffer_.substr(0, end + 4);
    buffer_.erase(0, end + 4);
    return head;
  }

  std::string handshake(const std::string &path = "/ws") {
    send_raw("GET " + path + " HTTP/1.1\r\nHost: localhost\r\nUpgrade: websocket\r\n"
             "Connection: Upgrade\r\nSec-WebSocket-Version: 13\r\nSec-WebSocket-Key: " +
             std::string(kClientKey) + "\r\nUser-Agent: gateway-test\r\n\r\n");
    return read_head();
  }

  void send_frame(const std::uint8_t opcode, const std::string &payload) {
    std::string frame;
    frame.push_back(static_cast<char>(0x80u | opcode));
    if (payload.size() < 126) {
      frame.push_back(static_cast<char>(0x80u | payload.size()));
    } else {
      frame.push_back(static_cast<char>(0x80u | 126u));
      frame.push_back(static_cast<char>((payload.size() >> 8u) & 0xFFu));
      frame.push_back(static_cast<char>(payload.size() & 0xFFu));
    }
    const std::array<std::uint8_t, 4> mask{0x12, 0x34, 0x56, 0x78};
    for (const auto byte : mask) {
      frame.push_back(static_cast<char>(byte));
    }
    for (std::size_t i = 0; i < payload.size(); ++i) {
      frame.push_back(static_cast<char>(static_cast<std::uint8_t>(payload[i]) ^ mask[i % 4]));
    }
    send_raw(frame);
  }

  void send_text(const std::string &payload) { send_frame(0x1u, payload); }

  /// Reads one unmasked server frame; false on timeout or disconnect.
  bool read_frame(std::uint8_t &opcode, std::string &payload) {
    if (!want(2)) {
      return false;
    }
    const auto b0 = static_cast<std::uint8_t>(buffer_[0]);
    const auto b1 = static_cast<std::uint8_t>(buffer_[1]);
    opcode = b0 & 0x0Fu;
    std::size_t header = 2;
    std::uint64_t length = b1 & 0x7Fu;
    if (length == 126u) {
      if (!want(4)) {
        return false;
      }
      length = (static_cast<std::uint64_t>(static_cast<std::uint8_t>(buffer_[2])) << 8u) |
               static_cast<std::uint8_t>(buffer_[3]);
      header = 4;
    } else if (length == 127u) {
      if (!want(10)) {
        return false;
      }
      length = 0;
      for (std::size_t i = 2; i < 10; ++i) {
        length = (length << 8u) | static_cast<std::uint8_t>(buffer_[i]);
      }
      header = 10;
    }
    if (!want(header + length)) {
      return false;
    }
    payload = buffer_.substr(header, static_cast<std::size_t>(length));
    buffer_.erase(0, header + static_cast<std::size_t>(length));
    return true;
  }

  /// Skips text events until one of `type` arrives.
  std::optional<events::Object> wait_for_event(const std::string &type) {
    std::uint8_t opcode = 0;
    std::string payload;
    while (read_frame(opcode, payload)) {
      if (opcode != 0x1u) {
        continue;
      }
      auto parsed = events::parse_json(payload);
      if (!parsed.ok() || !parsed.value().is_object()) {
        continue;
      }
      const auto &object = parsed.value().as_object();
      if (const auto *kind = object.find("type"); kind != nullptr && kind->as_string() == type) {
        return object;
      }
    }
    return std::nullopt;
  }

private:
  bool fill() {
    std::array<char, 4096> chunk{};
    const ssize_t n = ::recv(fd_, chunk.data(), chunk.size(), 0);
    if (n <= 0) {
      return false;
    }
    buffer_.append(chunk.data(), static_cast<std::size_t>(n));
    return true;
  }

  bool want(const std::size_t size) {
    while (buffer_.size() < size) {
      if (!fill()) {
        return false;
      }
    }
    return true;
  }

  int fd_ = -1;
  std::string buffer_;
};

/// Runtime plus a started server on an ephemeral loopback port.
struct LiveGateway {
  explicit LiveGateway(std::uint32_t max_connections = 8) : context(testing::mock_config()) {
    context.mutable_config().server.max_connections = max_connections;
    const auto initialized = context.initialize();
    if (!initialized.ok()) {
      throw std::runtime_error(initialized.error());
    }
    const auto started = server.start(context.gateway_options());
    if (!started.ok()) {
      throw std::runtime_error(started.error());
    }
  }

  ~LiveGateway() { server.stop(); }

  runtime::RuntimeContext context;
  gateway::GatewayServer server;
};

std::string data_field(const events::Object &message, const std::string &key) {
  const auto *data = message.find("data");
  if (data == nullptr || !data->is_object()) {
    return "";
  }
  const auto *value = data->as_object().find(key);
  return value != nullptr && value->is_string() ? value->as_string() : "";
}

} // namespace

void register_gateway_tests(std::vector<voxrelay::tests::TestCase> &tests) {
  using voxrelay::tests::require;

  tests.push_back({"gateway_parses_client_messages", [] {
                     auto ready = gateway::parse_client_message(R"({"type":"client-ready"})");
                     require(ready.ok() && ready.value().type == gateway::ClientMessageType::ClientReady,
                             "client-ready mismatch");

                     auto interim = gateway::parse_client_message(
                         R"({"type":"transcription","text":"hel","final":false,"user_id":"u1"})");
                     require(interim.ok() && !interim.value().final && interim.value().text == "hel" &&
                                 interim.value().user_id == "u1",
                             "interim transcription mismatch");
                     auto final_text =
                         gateway::parse_client_message(R"({"type":"transcription","text":"hello"})");
                     require(final_text.ok() && final_text.value().final,
                             "transcriptions are final by default");

                     auto context = gateway::parse_client_message(
                         R"({"type":"update-context","key":"lang","value":{"code":"en"}})");
                     require(context.ok() && context.value().key == "lang" &&
                                 context.value().value.as_object().find("code")->as_string() == "en",
                             "update-context mismatch");

                     require(gateway::parse_client_message(R"({"type":"user-started-speaking"})")
                                     .value()
                                     .type == gateway::ClientMessageType::UserStartedSpeaking,
                             "speaking mismatch");
                     require(!gateway::parse_client_message("not json").ok(), "garbage rejected");
                     require(!gateway::parse_client_message("[1]").ok(), "arrays rejected");
                     require(!gateway::parse_client_message(R"({"text":"x"})").ok(), "type required");
                     require(!gateway::parse_client_message(R"({"type":"dance"})").ok(),
                             "unknown type rejected");
                     require(!gateway::parse_client_message(R"({"type":"transcription"})").ok(),
                             "text required");
                     require(!gateway::parse_client_message(
                                  R"({"type":"transcription","text":"x","final":"yes"})")
                                  .ok(),
                             "final must be boolean");
                     require(!gateway::parse_client_message(R"({"type":"update-context","key":""})").ok(),
                             "context key required");
                   }});

  tests.push_back({"gateway_malformed_frame_gets_nonfatal_error", [] {
                     testing::RecordingChannel channel;
                     session::SessionOptions options{.session_id = "s1"};
                     session::Session live(options,
                                           std::make_shared<events::SelectiveEnricher>("s1", events::Object{}),
                                           testing::make_generator({"x"}), channel);
                     live.start();
                     gateway::handle_client_frame(live, "{broken");
                     gateway::handle_client_frame(live, R"({"type":"ping"})");
                     require(channel.log.wait_for(events::EventKind::ServerMessage, 1), "pong missing");

                     const auto delivered = channel.log.events();
                     require(delivered.size() == 2, "expected error then pong");
                     require(delivered[0].kind == events::EventKind::Error &&
                                 delivered[0].data()->find("fatal")->as_bool() == false &&
                                 testing::data_string(delivered[0], "error").find("invalid JSON") == 0,
                             "malformed frame should produce a non-fatal error");
                     require(delivered[1].data()->find("pong")->as_bool(), "pong flag missing");
                     require(live.is_open(), "session stays open after a bad frame");
                   }});

  tests.push_back({"gateway_static_bodies", [] {
                     require(gateway::health_body() == R"({"status":"healthy"})", "health body mismatch");
                     const auto page = gateway::index_page("/voice");
                     require(page.find("<code>/voice</code>") != std::string::npos,
                             "index page should name the socket path");
                   }});

  tests.push_back({"gateway_http_routes", [] {
                     LiveGateway live;
                     require(live.server.is_running() && live.server.port() != 0,
                             "server should bind an ephemeral port");
                     const auto port = live.server.port();

                     {
                       RawClient client(port);
                       client.send_raw("GET /health HTTP/1.1\r\nHost: x\r\n\r\n");
                       const auto response = client.read_until_closed();
                       require(response.rfind("HTTP/1.1 200 OK", 0) == 0, "health status: " + response);
                       require(response.find(R"({"status":"healthy"})") != std::string::npos,
                               "health body missing");
                     }
                     {
                       RawClient client(port);
                       client.send_raw("GET / HTTP/1.1\r\nHost: x\r\n\r\n");
                       const auto response = client.read_until_closed();
                       require(response.rfind("HTTP/1.1 200", 0) == 0 &&
                                   response.find("text/html") != std::string::npos,
                               "index route mismatch");
                     }
                     {
                       RawClient client(port);
                       client.send_raw("GET /nope HTTP/1.1\r\nHost: x\r\n\r\n");
                       require(client.read_until_closed().rfind("HTTP/1.1 404", 0) == 0,
                               "unknown path should be 404");
                     }
                     {
                       RawClient client(port);
                       client.send_raw("POST /health HTTP/1.1\r\nHost: x\r\nContent-Length: 0\r\n\r\n");
                       require(client.read_until_closed().rfind("HTTP/1.1 405", 0) == 0,
                               "non-GET should be 405");
                     }
                     {
                       RawClient client(port);
                       client.send_raw("GET /ws HTTP/1.1\r\nHost: x\r\n\r\n");
                       require(client.read_until_closed().rfind("HTTP/1.1 400", 0) == 0,
                               "plain GET on the socket path should be 400");
                     }
                   }});

  tests.push_back({"gateway_websocket_session_round_trip", [] {
                     LiveGateway live;
                     RawClient client(live.server.port());
                     const auto head = client.handshake();
                     require(head.rfind("HTTP/1.1 101", 0) == 0, "upgrade failed: " + head);
                     require(head.find(std::string("Sec-WebSocket-Accept: ") + kExpectedAccept) !=
                                 std::string::npos,
                             "accept key mismatch: " + head);

                     client.send_text(R"({"type":"client-ready"})");
                     const auto ready = client.wait_for_event("bot-ready");
                     require(ready.has_value(), "bot-ready not received");
                     const std::string session_id = data_field(*ready, "session_id");
                     require(session_id.size() == 36, "bot-ready should carry the session id");
                     require(ready->find("label")->as_string() == "rtvi-ai", "label mismatch");

                     client.send_text(R"({"type":"transcription","text":"hello","final":true})");
                     const auto text = client.wait_for_event("bot-llm-text");
                     require(text.has_value() && data_field(*text, "text") == "Hello! ",
                             "first fragment mismatch");
                     require(data_field(*text, "session_id") == session_id,
                             "events should be enriched with the session id");
                     require(client.wait_for_event("bot-llm-stopped").has_value(),
                             "turn should end with bot-llm-stopped");

                     client.send_frame(0x9u, "are-you-there");
                     std::uint8_t opcode = 0;
                     std::string payload;
                     while (client.read_frame(opcode, payload) && opcode != 0xAu) {
                     }
                     require(opcode == 0xAu && payload == "are-you-there", "ping should be echoed");

                     client.send_frame(0x8u, std::string("\x03\xE8", 2));
                     while (client.read_frame(opcode, payload) && opcode != 0x8u) {
                     }
                     require(opcode == 0x8u && payload == std::string("\x03\xE8", 2),
                             "close should be echoed");
                     require(testing::wait_until([&] { return live.server.stats().active_sessions == 0; }),
                             "session should be released after close");
                     require(live.server.stats().sessions_served == 1, "served counter mismatch");
                   }});

  tests.push_back({"gateway_rejects_connections_over_limit", [] {
                     LiveGateway live(1);
                     RawClient first(live.server.port());
                     require(first.handshake().rfind("HTTP/1.1 101", 0) == 0, "first upgrade failed");

                     RawClient second(live.server.port());
                     second.send_raw("GET /ws HTTP/1.1\r\nHost: x\r\nUpgrade: websocket\r\n"
                                     "Connection: Upgrade\r\nSec-WebSocket-Version: 13\r\n"
                                     "Sec-WebSocket-Key: " +
                                     std::string(kClientKey) + "\r\n\r\n");
                     const auto response = second.read_until_closed();
                     require(response.rfind("HTTP/1.1 503", 0) == 0, "limit should answer 503: " + response);
                   }});

  tests.push_back({"gateway_stop_closes_open_sessions", [] {
                     auto live = std::make_unique<LiveGateway>();
                     RawClient client(live->server.port());
                     require(client.handshake().rfind("HTTP/1.1 101", 0) == 0, "upgrade failed");
                     client.send_text(R"({"type":"client-ready"})");
                     require(client.wait_for_event("bot-ready").has_value(), "bot-ready not received");

                     live->server.stop();
                     require(!live->server.is_running(), "server should be stopped");
                     require(live->server.stats().open_connections == 0, "connections should be released");
                     std::uint8_t opcode = 0;
                     std::string payload;
                     while (client.read_frame(opcode, payload)) {
                     }
                     live.reset();
                   }});

  tests.push_back({"gateway_options_follow_config", [] {
                     auto config = testing::mock_config();
                     config.server.path = "/voice";
                     config.server.max_connections = 3;
                     runtime::RuntimeContext context(config);
                     const auto options = context.gateway_options();
                     require(options.host == "127.0.0.1" && options.port == 0 && options.path == "/voice" &&
                                 options.max_connections == 3,
                             "gateway options mismatch");
                     require(static_cast<bool>(options.session_factory), "session factory missing");

                     testing::RecordingChannel channel;
                     require(!context.create_session("peer", channel).ok(),
                             "uninitialized runtime cannot create sessions");
                     require(context.initialize().ok(), "initialize failed");
                     auto created = context.create_session("peer", channel);
                     require(created.ok(), created.error());
                     require(created.value()->enricher().policy() == "selective",
                             "configured enricher policy expected");
                   }});
}
