#include "voxrelay/config/config.hpp"

#include "voxrelay/common/fs.hpp"
#include "voxrelay/common/toml.hpp"
#include "voxrelay/observability/log_observer.hpp"
#include "voxrelay/turn/turn.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <vector>

namespace voxrelay::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".voxrelay";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("VOXRELAY_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

std::string strip_env_quotes(const std::string &raw) {
  std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    std::string out;
    out.reserve(value.size() - 2);
    bool escaped = false;
    for (std::size_t i = 1; i + 1 < value.size(); ++i) {
      const char ch = value[i];
      if (!escaped) {
        if (ch == '\\') {
          escaped = true;
          continue;
        }
        out.push_back(ch);
        continue;
      }
      switch (ch) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      default:
        out.push_back(ch);
        break;
      }
      escaped = false;
    }
    return out;
  }
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  return value;
}

bool is_valid_env_name(const std::string &name) {
  if (name.empty()) {
    return false;
  }
  if (!(std::isalpha(static_cast<unsigned char>(name.front())) != 0 || name.front() == '_')) {
    return false;
  }
  return std::all_of(name.begin(), name.end(), [](char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_';
  });
}

void set_env_if_missing(const std::string &name, const std::string &value) {
  if (!is_valid_env_name(name)) {
    return;
  }
  if (const char *existing = std::getenv(name.c_str()); existing != nullptr && *existing != '\0') {
    return;
  }
  setenv(name.c_str(), value.c_str(), 0);
}

void load_dotenv_file(const std::filesystem::path &path) {
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return;
  }

  std::ifstream file(path);
  if (!file) {
    return;
  }

  std::string line;
  while (std::getline(file, line)) {
    std::string trimmed = common::trim(line);
    if (trimmed.empty() || trimmed.front() == '#') {
      continue;
    }
    if (common::starts_with(trimmed, "export ")) {
      trimmed = common::trim(trimmed.substr(7));
    }

    const auto eq = trimmed.find('=');
    if (eq == std::string::npos) {
      continue;
    }

    const std::string key = common::trim(trimmed.substr(0, eq));
    if (key.empty()) {
      continue;
    }
    set_env_if_missing(key, strip_env_quotes(trimmed.substr(eq + 1)));
  }
}

void load_dotenv_files() {
  std::vector<std::filesystem::path> candidates;
  // Config dir .env wins over the working directory one.
  if (auto dir = config_dir(); dir.ok()) {
    candidates.push_back(dir.value() / ".env");
  }
  std::error_code ec;
  const auto cwd = std::filesystem::current_path(ec);
  if (!ec) {
    candidates.push_back(cwd / ".env");
  }

  for (const auto &candidate : candidates) {
    load_dotenv_file(candidate);
  }
}

const char *non_empty_env(const char *name) {
  const char *value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : nullptr;
}

bool is_valid_host(const std::string &host) {
  if (host.empty()) {
    return false;
  }
  return std::all_of(host.begin(), host.end(), [](char ch) {
    return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '.' || ch == '-' ||
           ch == ':' || ch == '_';
  });
}

/// Converts a raw TOML literal to an event value: strings, booleans, integers,
/// floats and arrays of those. Anything else is kept as its literal text.
events::Value toml_literal_to_value(const std::string &raw) {
  const std::string text = common::trim(raw);
  if (common::is_toml_string_literal(text)) {
    return events::Value(common::unquote_toml_string(text));
  }
  if (text == "true") {
    return events::Value(true);
  }
  if (text == "false") {
    return events::Value(false);
  }

  std::string digits = text;
  std::erase(digits, '_');
  std::int64_t integer = 0;
  const auto *first = digits.data();
  const auto *last = first + digits.size();
  if (first != last && *first == '+') {
    ++first;
  }
  if (auto [ptr, ec] = std::from_chars(first, last, integer);
      ec == std::errc() && ptr == last && first != last) {
    return events::Value(integer);
  }
  if (!digits.empty()) {
    char *end = nullptr;
    const double number = std::strtod(digits.c_str(), &end);
    if (end != nullptr && *end == '\0') {
      return events::Value(number);
    }
  }

  if (text.size() >= 2 && text.front() == '[' && text.back() == ']') {
    auto parsed = events::parse_json(text);
    if (parsed.ok()) {
      return std::move(parsed.value());
    }
  }
  return events::Value(text);
}

events::Object load_value_table(const common::TomlDocument &doc, const std::string &prefix) {
  events::Object table;
  for (const auto &key : doc.table_keys(prefix)) {
    if (const auto *raw = doc.raw(prefix + "." + key); raw != nullptr) {
      table.set(key, toml_literal_to_value(*raw));
    }
  }
  return table;
}

void load_document(Config &config, const common::TomlDocument &doc) {
  config.server.host = doc.get_string("server.host", config.server.host);
  config.server.port = static_cast<std::uint16_t>(doc.get_int("server.port", config.server.port));
  config.server.path = doc.get_string("server.path", config.server.path);
  config.server.max_connections = static_cast<std::uint32_t>(
      doc.get_u64("server.max_connections", config.server.max_connections));
  config.server.tls_enabled = doc.get_bool("server.tls_enabled", config.server.tls_enabled);
  config.server.tls_cert_file =
      expand_config_value(doc.get_string("server.tls_cert_file", config.server.tls_cert_file));
  config.server.tls_key_file =
      expand_config_value(doc.get_string("server.tls_key_file", config.server.tls_key_file));

  config.generator.backend = doc.get_string("generator.backend", config.generator.backend);
  config.generator.base_url =
      expand_config_value(doc.get_string("generator.base_url", config.generator.base_url));
  if (doc.has("generator.api_key")) {
    config.generator.api_key = expand_config_value(doc.get_string("generator.api_key"));
  }
  config.generator.model = doc.get_string("generator.model", config.generator.model);
  config.generator.temperature =
      doc.get_double("generator.temperature", config.generator.temperature);
  config.generator.timeout_ms = doc.get_u64("generator.timeout_ms", config.generator.timeout_ms);
  config.generator.max_history_turns = static_cast<std::size_t>(
      doc.get_u64("generator.max_history_turns", config.generator.max_history_turns));
  config.generator.system_prompt =
      doc.get_string("generator.system_prompt", config.generator.system_prompt);
  for (const auto &keyword : doc.table_keys("generator.templates")) {
    config.generator.templates.emplace_back(
        keyword, doc.get_string("generator.templates." + keyword));
  }

  config.turns.concurrent_policy =
      doc.get_string("turns.concurrent_policy", config.turns.concurrent_policy);

  config.enricher.policy = doc.get_string("enricher.policy", config.enricher.policy);
  config.enricher.user_agent = doc.get_string("enricher.user_agent", config.enricher.user_agent);
  config.enricher.metadata = load_value_table(doc, "enricher.metadata");
  config.enricher.inject = load_value_table(doc, "enricher.inject");

  config.events.queue_capacity = static_cast<std::size_t>(
      doc.get_u64("events.queue_capacity", config.events.queue_capacity));

  config.tts.enabled = doc.get_bool("tts.enabled", config.tts.enabled);
  config.tts.backend = doc.get_string("tts.backend", config.tts.backend);
  config.tts.command = doc.get_string("tts.command", config.tts.command);
  if (doc.has("tts.voice")) {
    config.tts.voice = doc.get_string("tts.voice");
  }
  if (doc.has("tts.rate")) {
    // Accept both `rate = 180` and `rate = "180"`.
    config.tts.rate = doc.get_string("tts.rate");
  }
  config.tts.dry_run = doc.get_bool("tts.dry_run", config.tts.dry_run);

  config.transcripts.enabled = doc.get_bool("transcripts.enabled", config.transcripts.enabled);
  config.transcripts.path = doc.get_string("transcripts.path", config.transcripts.path);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.log_level =
      doc.get_string("observability.log_level", config.observability.log_level);
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

const std::vector<std::string> &known_generator_backends() {
  static const std::vector<std::string> backends = {"template", "openai", "compatible",
                                                    "ollama"};
  return backends;
}

void apply_env_overrides(Config &config) {
  load_dotenv_files();

  if (const char *host = non_empty_env("VOXRELAY_HOST")) {
    config.server.host = host;
  }
  if (const char *port = non_empty_env("VOXRELAY_PORT")) {
    const std::string text(port);
    std::uint16_t parsed = 0;
    if (auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
        ec == std::errc() && ptr == text.data() + text.size()) {
      config.server.port = parsed;
    }
  }
  if (const char *backend = non_empty_env("VOXRELAY_GENERATOR")) {
    config.generator.backend = backend;
  }
  if (const char *model = non_empty_env("VOXRELAY_MODEL")) {
    config.generator.model = model;
  }
  if (const char *base_url = non_empty_env("VOXRELAY_BASE_URL")) {
    config.generator.base_url = base_url;
  }
  if (const char *policy = non_empty_env("VOXRELAY_ENRICHER_POLICY")) {
    config.enricher.policy = policy;
  }
  if (const char *policy = non_empty_env("VOXRELAY_TURN_POLICY")) {
    config.turns.concurrent_policy = policy;
  }

  if (const char *api_key = non_empty_env("VOXRELAY_API_KEY")) {
    config.generator.api_key = std::string(api_key);
    return;
  }
  if (config.generator.api_key.has_value() && !common::trim(*config.generator.api_key).empty()) {
    return;
  }
  if (const char *openai_key = non_empty_env("OPENAI_API_KEY")) {
    config.generator.api_key = std::string(openai_key);
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  Config config;
  load_document(config, parsed.value());
  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto config = parse_config(buffer.str());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  const std::string backend = common::to_lower(common::trim(config.generator.backend));
  const auto &backends = known_generator_backends();
  if (std::find(backends.begin(), backends.end(), backend) == backends.end()) {
    return common::Result<std::vector<std::string>>::failure("Unknown generator.backend: " +
                                                              config.generator.backend);
  }

  if (config.generator.temperature < 0.0 || config.generator.temperature > 2.0) {
    return common::Result<std::vector<std::string>>::failure(
        "generator.temperature must be between 0.0 and 2.0");
  }

  const std::string policy = common::to_lower(common::trim(config.enricher.policy));
  if (policy != "selective" && policy != "global") {
    return common::Result<std::vector<std::string>>::failure("Invalid enricher.policy: " +
                                                              config.enricher.policy);
  }

  if (!turn::parse_concurrent_policy(config.turns.concurrent_policy).has_value()) {
    return common::Result<std::vector<std::string>>::failure(
        "Invalid turns.concurrent_policy: " + config.turns.concurrent_policy);
  }

  if (config.events.queue_capacity == 0) {
    return common::Result<std::vector<std::string>>::failure("events.queue_capacity must be > 0");
  }

  if (!is_valid_host(config.server.host)) {
    return common::Result<std::vector<std::string>>::failure("server.host is invalid: " +
                                                              config.server.host);
  }
  if (config.server.path.empty() || config.server.path.front() != '/') {
    return common::Result<std::vector<std::string>>::failure(
        "server.path must start with '/': " + config.server.path);
  }
  if (config.server.max_connections == 0) {
    return common::Result<std::vector<std::string>>::failure("server.max_connections must be > 0");
  }
  if (config.server.port != 0 && config.server.port < 1024) {
    warnings.push_back("server.port " + std::to_string(config.server.port) +
                       " is privileged and may require elevated permissions");
  }
  if (config.server.tls_enabled) {
    if (config.server.tls_cert_file.empty() || config.server.tls_key_file.empty()) {
      return common::Result<std::vector<std::string>>::failure(
          "server TLS requires tls_cert_file and tls_key_file");
    }
    std::error_code ec;
    if (!std::filesystem::exists(config.server.tls_cert_file, ec)) {
      return common::Result<std::vector<std::string>>::failure(
          "server.tls_cert_file does not exist: " + config.server.tls_cert_file);
    }
    if (!std::filesystem::exists(config.server.tls_key_file, ec)) {
      return common::Result<std::vector<std::string>>::failure(
          "server.tls_key_file does not exist: " + config.server.tls_key_file);
    }
  }

  const bool api_key_missing =
      !config.generator.api_key.has_value() || common::trim(*config.generator.api_key).empty();
  if (backend == "openai" && api_key_missing) {
    warnings.push_back(
        "generator.backend is openai but no API key is set (generator.api_key, VOXRELAY_API_KEY, "
        "or OPENAI_API_KEY); every turn will fail");
  }
  if (backend == "compatible" && common::trim(config.generator.base_url).empty()) {
    warnings.push_back("generator.backend is compatible but generator.base_url is empty");
  }
  if (backend != "template" && !config.generator.templates.empty()) {
    warnings.push_back("generator.templates is ignored by the " + backend + " backend");
  }

  if (config.tts.enabled) {
    if (common::to_lower(config.tts.backend) != "system") {
      return common::Result<std::vector<std::string>>::failure("Unknown tts.backend: " +
                                                                config.tts.backend);
    }
  }

  if (config.transcripts.enabled && common::trim(config.transcripts.path).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "transcripts.path is required when transcripts are enabled");
  }

  if (!observability::parse_log_level(config.observability.log_level).has_value()) {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.log_level: " +
                                                              config.observability.log_level);
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace voxrelay::config
