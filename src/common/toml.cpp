#include "voxrelay/common/toml.hpp"

#include "voxrelay/common/fs.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>

namespace voxrelay::common {

namespace {

std::string strip_comment(const std::string &line) {
  char quote = '\0';
  std::string output;
  output.reserve(line.size());

  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (quote == '\0' && (ch == '"' || ch == '\'')) {
      quote = ch;
    } else if (quote != '\0' && ch == quote && (quote == '\'' || i == 0 || line[i - 1] != '\\')) {
      quote = '\0';
    }
    if (quote == '\0' && ch == '#') {
      break;
    }
    output.push_back(ch);
  }

  return output;
}

template <typename T> bool parse_integral(const std::string &raw, T &out) {
  std::string normalized = trim(raw);
  std::erase(normalized, '_');
  const auto *first = normalized.data();
  const auto *last = first + normalized.size();
  if (first != last && *first == '+') {
    ++first;
  }
  auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc() && ptr == last && first != last;
}

} // namespace

bool is_toml_string_literal(const std::string &raw) {
  const std::string value = trim(raw);
  return value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                               (value.front() == '\'' && value.back() == '\''));
}

std::string unquote_toml_string(const std::string &raw) {
  const std::string value = trim(raw);
  if (!is_toml_string_literal(value)) {
    return value;
  }
  const std::string body = value.substr(1, value.size() - 2);
  if (value.front() == '\'') {
    return body;
  }

  std::string out;
  out.reserve(body.size());
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (body[i] != '\\' || i + 1 >= body.size()) {
      out.push_back(body[i]);
      continue;
    }
    const char esc = body[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'r':
      out.push_back('\r');
      break;
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

const std::string *TomlDocument::raw(const std::string &key) const {
  const auto it = values.find(key);
  return it == values.end() ? nullptr : &it->second;
}

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto *value = raw(key);
  return value == nullptr ? fallback : unquote_toml_string(*value);
}

bool TomlDocument::get_bool(const std::string &key, bool fallback) const {
  const auto *value = raw(key);
  if (value == nullptr) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(*value));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

int TomlDocument::get_int(const std::string &key, int fallback) const {
  const auto *value = raw(key);
  int parsed = 0;
  if (value == nullptr || !parse_integral(*value, parsed)) {
    return fallback;
  }
  return parsed;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, std::uint64_t fallback) const {
  const auto *value = raw(key);
  std::uint64_t parsed = 0;
  if (value == nullptr || !parse_integral(*value, parsed)) {
    return fallback;
  }
  return parsed;
}

double TomlDocument::get_double(const std::string &key, double fallback) const {
  const auto *value = raw(key);
  if (value == nullptr) {
    return fallback;
  }
  const std::string normalized = trim(*value);
  if (normalized.empty()) {
    return fallback;
  }
  char *end = nullptr;
  const double parsed = std::strtod(normalized.c_str(), &end);
  if (end == nullptr || *end != '\0') {
    return fallback;
  }
  return parsed;
}

std::vector<std::string> TomlDocument::table_keys(const std::string &prefix) const {
  const std::string dotted = prefix + ".";
  std::vector<std::string> keys;
  for (const auto &key : order) {
    if (!starts_with(key, dotted)) {
      continue;
    }
    const std::string rest = key.substr(dotted.size());
    if (!rest.empty() && rest.find('.') == std::string::npos) {
      keys.push_back(rest);
    }
  }
  return keys;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string current_section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean_line = trim(strip_comment(line));
    if (clean_line.empty()) {
      continue;
    }

    if (clean_line.front() == '[' && clean_line.back() == ']') {
      current_section = trim(clean_line.substr(1, clean_line.size() - 2));
      if (current_section.empty()) {
        return Result<TomlDocument>::failure("invalid empty table header at line " +
                                             std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals_index = clean_line.find('=');
    if (equals_index == std::string::npos) {
      return Result<TomlDocument>::failure("expected key = value at line " +
                                           std::to_string(line_number));
    }

    std::string key = trim(clean_line.substr(0, equals_index));
    const std::string value = trim(clean_line.substr(equals_index + 1));
    if (is_toml_string_literal(key)) {
      key = unquote_toml_string(key);
    }
    if (key.empty()) {
      return Result<TomlDocument>::failure("missing key at line " + std::to_string(line_number));
    }
    if (value.empty()) {
      return Result<TomlDocument>::failure("missing value for '" + key + "' at line " +
                                           std::to_string(line_number));
    }

    const std::string full_key = current_section.empty() ? key : current_section + "." + key;
    if (!document.values.contains(full_key)) {
      document.order.push_back(full_key);
    }
    document.values[full_key] = value;
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace voxrelay::common
