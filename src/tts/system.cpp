#include "voxrelay/tts/tts.hpp"

#include "voxrelay/common/fs.hpp"
#include "voxrelay/common/ids.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace voxrelay::tts {

namespace {

std::string shell_quote(const std::string &value) {
  std::string out;
  out.reserve(value.size() + 4);
  out.push_back('\'');
  for (const char ch : value) {
    if (ch == '\'') {
      out += "'\\''";
      continue;
    }
    out.push_back(ch);
  }
  out.push_back('\'');
  return out;
}

std::string basename(const std::string &path) {
  const auto slash = path.find_last_of("/\\");
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

int run_with_system(const std::string &command) { return std::system(command.c_str()); }

bool command_exists(const std::string &command) {
  const std::string probe = "command -v " + shell_quote(command) + " >/dev/null 2>&1";
  return std::system(probe.c_str()) == 0;
}

common::Result<std::vector<std::uint8_t>> read_bytes(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return common::Result<std::vector<std::uint8_t>>::failure("synthesizer produced no file: " +
                                                              path.string());
  }
  std::vector<std::uint8_t> out((std::istreambuf_iterator<char>(in)),
                                std::istreambuf_iterator<char>());
  return common::Result<std::vector<std::uint8_t>>::success(std::move(out));
}

std::string default_backend() {
#ifdef __APPLE__
  return "say";
#else
  return "espeak";
#endif
}

} // namespace

SystemTtsProvider::SystemTtsProvider(SystemTtsConfig config) : config_(std::move(config)) {
  if (!config_.command_runner) {
    config_.command_runner = run_with_system;
  }
}

bool SystemTtsProvider::health_check() {
  if (config_.dry_run) {
    return true;
  }
  std::string backend;
  (void)build_command(TtsRequest{.text = "health-check"}, &backend);
  return !backend.empty() && command_exists(backend);
}

std::string SystemTtsProvider::build_command(const TtsRequest &request,
                                             std::string *selected_backend) const {
  std::string backend = common::trim(config_.command);
  if (backend.empty()) {
    backend = default_backend();
  }
  if (selected_backend != nullptr) {
    *selected_backend = backend;
  }

  const std::string backend_name = common::to_lower(basename(backend));
  const std::string voice =
      common::trim(request.voice.value_or(config_.default_voice.value_or("")));
  std::string rate = common::trim(config_.default_rate.value_or(""));
  if (request.speed.has_value() && *request.speed > 0.0) {
    rate = std::to_string(static_cast<int>(*request.speed * 175.0));
  }

  const bool is_say = backend_name == "say";
  std::ostringstream cmd;
  cmd << shell_quote(backend);
  if (!voice.empty()) {
    cmd << " -v " << shell_quote(voice);
  }
  if (!rate.empty()) {
    cmd << (is_say ? " -r " : " -s ") << shell_quote(rate);
  }
  if (request.output_path.has_value()) {
    cmd << (is_say ? " --data-format=LEI16@22050 -o " : " -w ")
        << shell_quote(request.output_path->string());
  }
  cmd << " " << shell_quote(request.text);
  return cmd.str();
}

common::Result<TtsAudio> SystemTtsProvider::synthesize(const TtsRequest &request) {
  const std::string text = common::trim(request.text);
  if (text.empty()) {
    return common::Result<TtsAudio>::failure("TTS text is empty");
  }

  TtsAudio audio;
  audio.provider = std::string(id());
  audio.mime_type = "audio/wav";

  if (config_.dry_run || request.dry_run) {
    audio.mime_type = "text/plain";
    audio.bytes.assign(text.begin(), text.end());
    return common::Result<TtsAudio>::success(std::move(audio));
  }

  TtsRequest effective = request;
  effective.text = text;
  const bool scratch = !effective.output_path.has_value();
  if (scratch) {
    std::filesystem::path dir = config_.scratch_dir;
    if (dir.empty()) {
      std::error_code ec;
      dir = std::filesystem::temp_directory_path(ec);
      if (ec) {
        dir = "/tmp";
      }
    }
    effective.output_path = dir / ("voxrelay-tts-" + common::random_hex(8) + ".wav");
  }

  std::string backend;
  const std::string command = build_command(effective, &backend);
  if (!command_exists(backend)) {
    return common::Result<TtsAudio>::failure("system TTS backend not found on PATH: " + backend);
  }

  const int code = config_.command_runner(command);
  if (code != 0) {
    return common::Result<TtsAudio>::failure("system TTS command failed with exit code " +
                                             std::to_string(code));
  }

  auto bytes = read_bytes(*effective.output_path);
  if (scratch) {
    std::error_code ec;
    std::filesystem::remove(*effective.output_path, ec);
  }
  if (!bytes.ok()) {
    return common::Result<TtsAudio>::failure(bytes.error());
  }
  audio.bytes = std::move(bytes.value());
  return common::Result<TtsAudio>::success(std::move(audio));
}

} // namespace voxrelay::tts
