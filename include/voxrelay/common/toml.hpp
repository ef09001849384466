#pragma once

#include "voxrelay/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace voxrelay::common {

/// Flat view of a TOML file: every value is stored under "section.key" as its raw
/// literal text. Keys keep their file order in `order`.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;
  std::vector<std::string> order;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] int get_int(const std::string &key, int fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback) const;

  /// Direct children of a table, e.g. prefix "enricher.metadata" yields the keys of
  /// [enricher.metadata] without the prefix, in file order.
  [[nodiscard]] std::vector<std::string> table_keys(const std::string &prefix) const;
  [[nodiscard]] const std::string *raw(const std::string &key) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
/// True when the raw literal is a basic or literal TOML string.
[[nodiscard]] bool is_toml_string_literal(const std::string &raw);
/// Strips quotes and resolves escapes of a TOML string literal.
[[nodiscard]] std::string unquote_toml_string(const std::string &raw);

} // namespace voxrelay::common
