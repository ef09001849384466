#include "voxrelay/response/factory.hpp"

#include "voxrelay/common/fs.hpp"
#include "voxrelay/response/provider_generator.hpp"

#include <sstream>

namespace voxrelay::response {

namespace {

constexpr const char *OPENAI_BASE_URL = "https://api.openai.com/v1";
constexpr const char *OLLAMA_BASE_URL = "http://localhost:11434/v1";

std::string trim_trailing_slash(std::string url) {
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url;
}

ProviderGeneratorConfig base_provider_config(const config::GeneratorConfig &config) {
  ProviderGeneratorConfig out;
  out.api_key = common::trim(config.api_key.value_or(""));
  out.model = config.model;
  out.temperature = config.temperature;
  out.timeout_ms = config.timeout_ms;
  out.max_history_turns = config.max_history_turns;
  return out;
}

} // namespace

std::vector<TemplateRule> template_rules_from_config(const config::GeneratorConfig &config) {
  std::vector<TemplateRule> rules;
  for (const auto &[key, reply] : config.templates) {
    TemplateRule rule;
    std::stringstream stream(key);
    std::string keyword;
    while (std::getline(stream, keyword, '|')) {
      keyword = common::to_lower(common::trim(keyword));
      if (!keyword.empty()) {
        rule.keywords.push_back(std::move(keyword));
      }
    }
    if (rule.keywords.empty() || common::trim(reply).empty()) {
      continue;
    }
    rule.reply = reply;
    rules.push_back(std::move(rule));
  }
  return rules;
}

common::Result<std::shared_ptr<IResponseGenerator>>
create_response_generator(const config::GeneratorConfig &config,
                          std::shared_ptr<HttpClient> http_client) {
  const std::string backend = common::to_lower(common::trim(config.backend));
  if (backend.empty() || backend == "template") {
    return common::Result<std::shared_ptr<IResponseGenerator>>::success(
        std::make_shared<TemplateResponseGenerator>(template_rules_from_config(config)));
  }

  if (http_client == nullptr) {
    http_client = std::make_shared<CurlHttpClient>();
  }

  auto provider = base_provider_config(config);
  const std::string configured_url = trim_trailing_slash(common::trim(config.base_url));
  if (backend == "openai") {
    provider.name = "openai";
    provider.base_url = configured_url.empty() ? OPENAI_BASE_URL : configured_url;
    provider.require_api_key = true;
  } else if (backend == "ollama") {
    provider.name = "ollama";
    provider.base_url = configured_url.empty() ? OLLAMA_BASE_URL : configured_url;
    provider.require_api_key = false;
  } else if (backend == "compatible") {
    if (configured_url.empty()) {
      return common::Result<std::shared_ptr<IResponseGenerator>>::failure(
          "generator.base_url is required for the compatible backend");
    }
    provider.name = "compatible";
    provider.base_url = configured_url;
    provider.require_api_key = false;
  } else {
    return common::Result<std::shared_ptr<IResponseGenerator>>::failure(
        "Unknown generator backend: " + config.backend);
  }

  return common::Result<std::shared_ptr<IResponseGenerator>>::success(
      std::make_shared<ProviderResponseGenerator>(std::move(provider), std::move(http_client)));
}

} // namespace voxrelay::response
