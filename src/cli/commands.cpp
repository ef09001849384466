#include "voxrelay/cli/commands.hpp"

#include "voxrelay/common/fs.hpp"
#include "voxrelay/config/config.hpp"
#include "voxrelay/events/event.hpp"
#include "voxrelay/gateway/websocket.hpp"
#include "voxrelay/observability/global.hpp"
#include "voxrelay/runtime/app.hpp"

#include <atomic>
#include <charconv>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <iostream>
#include <mutex>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace voxrelay::cli {

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void handle_stop_signal(int) { g_stop_requested = 1; }

std::string version_string() {
#ifdef VOXRELAY_VERSION
  std::string version = VOXRELAY_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef VOXRELAY_GIT_COMMIT
  const std::string commit = VOXRELAY_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "voxrelay " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

template <typename T> bool parse_number(const std::string &text, T &out) {
  const auto *first = text.data();
  const auto *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last && first != last;
}

/// Loads the configuration, builds the shared collaborators and installs the observer.
common::Result<runtime::RuntimeContext> prepare_runtime() {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    return context;
  }
  auto warnings = context.value().initialize();
  if (!warnings.ok()) {
    return common::Result<runtime::RuntimeContext>::failure("invalid configuration: " +
                                                             warnings.error());
  }
  for (const auto &warning : warnings.value()) {
    std::cerr << "[config] warning: " << warning << "\n";
  }
  context.value().install_observer();
  return context;
}

/// Prints the bot side of a console conversation.
class ConsoleChannel final : public events::IEventChannel {
public:
  ConsoleChannel(std::ostream &out, bool json) : out_(out), json_(json) {}

  common::Status send_urgent(const events::OutboundEvent &event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (json_) {
      out_ << event.to_json() << "\n";
    } else {
      const auto *data = event.data();
      const auto *text = data == nullptr ? nullptr : data->find("text");
      switch (event.kind) {
      case events::EventKind::BotLlmStarted:
        out_ << "bot> ";
        break;
      case events::EventKind::BotLlmText:
        if (text != nullptr && text->is_string()) {
          out_ << text->as_string();
        }
        break;
      case events::EventKind::BotLlmStopped:
        out_ << "\n";
        break;
      case events::EventKind::Error:
        if (data != nullptr && data->find("message") != nullptr &&
            data->find("message")->is_string()) {
          out_ << "[error] " << data->find("message")->as_string() << "\n";
        }
        break;
      default:
        break;
      }
    }
    out_.flush();
    if (event.kind == events::EventKind::BotLlmStopped) {
      ++turns_ended_;
      cv_.notify_all();
    }
    return common::Status::success();
  }

  bool wait_for_turn_end(const std::uint64_t expected, const std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&]() { return turns_ended_ >= expected; });
  }

private:
  std::ostream &out_;
  bool json_;
  std::mutex mutex_;
  std::condition_variable cv_;
  std::uint64_t turns_ended_ = 0;
};

int run_serve(std::vector<std::string> args) {
  std::string host;
  std::string port_raw;
  std::string duration_raw;
  const bool once = take_flag(args, "--once");
  (void)take_option(args, "--host", "", host);
  (void)take_option(args, "--port", "-p", port_raw);
  (void)take_option(args, "--duration-secs", "", duration_raw);

  auto context = prepare_runtime();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }

  auto options = context.value().gateway_options();
  if (!host.empty()) {
    options.host = host;
  }
  if (!port_raw.empty() && !parse_number(port_raw, options.port)) {
    std::cerr << "invalid port: " << port_raw << "\n";
    return 1;
  }
  int duration = 0;
  if (!duration_raw.empty() && !parse_number(duration_raw, duration)) {
    std::cerr << "invalid duration: " << duration_raw << "\n";
    return 1;
  }

  std::signal(SIGPIPE, SIG_IGN);
  std::signal(SIGINT, handle_stop_signal);
  std::signal(SIGTERM, handle_stop_signal);

  gateway::GatewayServer server;
  const auto status = server.start(options);
  if (!status.ok()) {
    std::cerr << status.error() << "\n";
    return 1;
  }

  const std::string scheme = options.tls_enabled ? "wss" : "ws";
  std::cout << "VoxRelay listening on " << scheme << "://" << options.host << ":" << server.port()
            << options.path << "\n";
  std::cout << "Health check: http" << (options.tls_enabled ? "s" : "") << "://" << options.host
            << ":" << server.port() << "/health\n";
  std::cout << "Generator: " << context.value().generator()->name() << "\n";

  if (!once) {
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(duration);
    while (g_stop_requested == 0) {
      if (duration > 0 && std::chrono::steady_clock::now() >= deadline) {
        break;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
  }

  server.stop();
  if (auto observer = observability::get_global_observer(); observer != nullptr) {
    observer->flush();
  }
  return 0;
}

int run_chat(std::vector<std::string> args) {
  std::string message;
  const bool json = take_flag(args, "--json");
  (void)take_option(args, "--message", "-m", message);

  auto context = prepare_runtime();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }

  ConsoleChannel channel(std::cout, json);
  auto created = context.value().create_session("console", channel);
  if (!created.ok()) {
    std::cerr << created.error() << "\n";
    return 1;
  }
  auto session = std::move(created.value());
  session->start();
  session->on_client_ready();

  const auto turn_timeout =
      std::chrono::milliseconds(context.value().config().generator.timeout_ms + 5'000);
  std::uint64_t turns_started = 0;
  const auto converse = [&](const std::string &text) {
    const auto result = session->on_transcription(text, true, "console");
    if (result == turn::SubmitResult::Started || result == turn::SubmitResult::Queued) {
      ++turns_started;
      if (!channel.wait_for_turn_end(turns_started, turn_timeout)) {
        std::cerr << "[chat] timed out waiting for a reply\n";
      }
    }
  };

  if (!message.empty()) {
    converse(message);
    session->close();
    return 0;
  }

  std::cout << "VoxRelay console (session " << session->id() << "). /history, /quit\n";
  std::string line;
  while (true) {
    std::cout << "you> " << std::flush;
    if (!std::getline(std::cin, line)) {
      break;
    }
    const std::string input = common::trim(line);
    if (input.empty()) {
      continue;
    }
    if (input == "/quit" || input == "/exit") {
      break;
    }
    if (input == "/history") {
      for (const auto &entry : session->history()) {
        std::cout << "  " << conversation::role_name(entry.role) << ": " << entry.text << "\n";
      }
      continue;
    }
    converse(input);
  }

  session->close();
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  voxrelay [--config PATH] <command> [options]\n\n";
  std::cout << "COMMANDS\n";
  std::cout << "  serve [--host H] [--port P] [--duration-secs N] [--once]\n";
  std::cout << "                 Run the WebSocket voice gateway\n";
  std::cout << "  chat [-m MSG] [--json]\n";
  std::cout << "                 Talk to the response stage from the terminal\n";
  std::cout << "  config-path    Print the configuration file location\n";
  std::cout << "  version        Show version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "serve") {
    return run_serve(std::move(args));
  }
  if (subcommand == "chat") {
    return run_chat(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace voxrelay::cli
