#pragma once

#include "voxrelay/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace voxrelay::tts {

struct TtsRequest {
  std::string text;
  std::optional<std::string> voice;
  std::optional<double> speed;
  std::optional<std::filesystem::path> output_path;
  bool dry_run = false;
};

struct TtsAudio {
  std::string provider;
  std::string mime_type;
  std::vector<std::uint8_t> bytes;
};

class ITtsProvider {
public:
  virtual ~ITtsProvider() = default;

  [[nodiscard]] virtual std::string_view id() const = 0;
  /// Must be callable from several sessions at once.
  [[nodiscard]] virtual common::Result<TtsAudio> synthesize(const TtsRequest &request) = 0;
  [[nodiscard]] virtual bool health_check() = 0;
};

using CommandRunner = std::function<int(const std::string &)>;

struct SystemTtsConfig {
  /// Binary to run; empty selects `say` on macOS and `espeak` elsewhere.
  std::string command;
  std::optional<std::string> default_voice;
  std::optional<std::string> default_rate;
  bool dry_run = false;
  /// Where intermediate WAV files go; empty means the system temp directory.
  std::filesystem::path scratch_dir;
  CommandRunner command_runner;
};

/// Renders speech with a local command line synthesizer into a WAV file.
class SystemTtsProvider final : public ITtsProvider {
public:
  explicit SystemTtsProvider(SystemTtsConfig config);

  [[nodiscard]] std::string_view id() const override { return "system"; }
  [[nodiscard]] common::Result<TtsAudio> synthesize(const TtsRequest &request) override;
  [[nodiscard]] bool health_check() override;

  [[nodiscard]] std::string build_command(const TtsRequest &request,
                                          std::string *selected_backend = nullptr) const;

private:
  SystemTtsConfig config_;
};

/// Registry of providers with a default. Providers are registered during startup;
/// synthesis may then run concurrently.
class TtsEngine {
public:
  [[nodiscard]] common::Status register_provider(std::unique_ptr<ITtsProvider> provider);
  [[nodiscard]] common::Status set_default_provider(const std::string &provider_id);
  [[nodiscard]] common::Result<TtsAudio> synthesize(const TtsRequest &request,
                                                    const std::string &provider_id = "");
  [[nodiscard]] std::vector<std::string> list_providers() const;
  [[nodiscard]] std::string default_provider() const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<ITtsProvider>> providers_;
  std::string default_provider_;
};

} // namespace voxrelay::tts
