#include "voxrelay/tts/tts.hpp"

#include "voxrelay/common/fs.hpp"

#include <algorithm>

namespace voxrelay::tts {

common::Status TtsEngine::register_provider(std::unique_ptr<ITtsProvider> provider) {
  if (provider == nullptr) {
    return common::Status::error("provider is required");
  }

  const std::string key(provider->id());
  if (common::trim(key).empty()) {
    return common::Status::error("provider id is empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (providers_.contains(key)) {
    return common::Status::error("provider already registered: " + key);
  }
  providers_.emplace(key, std::shared_ptr<ITtsProvider>(std::move(provider)));
  if (default_provider_.empty()) {
    default_provider_ = key;
  }
  return common::Status::success();
}

common::Status TtsEngine::set_default_provider(const std::string &provider_id) {
  const std::string key = common::trim(provider_id);
  if (key.empty()) {
    return common::Status::error("provider id is required");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (!providers_.contains(key)) {
    return common::Status::error("unknown TTS provider: " + key);
  }
  default_provider_ = key;
  return common::Status::success();
}

common::Result<TtsAudio> TtsEngine::synthesize(const TtsRequest &request,
                                               const std::string &provider_id) {
  std::shared_ptr<ITtsProvider> provider;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (providers_.empty()) {
      return common::Result<TtsAudio>::failure("no TTS providers are registered");
    }
    std::string selected = common::trim(provider_id);
    if (selected.empty()) {
      selected = default_provider_;
    }
    const auto it = providers_.find(selected);
    if (it == providers_.end()) {
      return common::Result<TtsAudio>::failure("unknown TTS provider: " + selected);
    }
    provider = it->second;
  }
  return provider->synthesize(request);
}

std::vector<std::string> TtsEngine::list_providers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> out;
  out.reserve(providers_.size());
  for (const auto &entry : providers_) {
    out.push_back(entry.first);
  }
  std::sort(out.begin(), out.end());
  return out;
}

std::string TtsEngine::default_provider() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return default_provider_;
}

} // namespace voxrelay::tts
