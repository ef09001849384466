#pragma once

#include "voxrelay/common/result.hpp"
#include "voxrelay/config/schema.hpp"
#include "voxrelay/response/generator.hpp"
#include "voxrelay/response/http_client.hpp"
#include "voxrelay/response/template_generator.hpp"

#include <memory>

namespace voxrelay::response {

/// [generator.templates] entries as rules; "a|b" keys list alternative keywords.
[[nodiscard]] std::vector<TemplateRule> template_rules_from_config(const config::GeneratorConfig &config);

/// Builds the generator named by `generator.backend`. Remote backends share `http_client`,
/// which defaults to a CurlHttpClient.
[[nodiscard]] common::Result<std::shared_ptr<IResponseGenerator>>
create_response_generator(const config::GeneratorConfig &config,
                          std::shared_ptr<HttpClient> http_client = nullptr);

} // namespace voxrelay::response
