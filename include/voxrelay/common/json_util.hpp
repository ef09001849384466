#pragma once

#include <cstddef>
#include <string>

namespace voxrelay::common {

/// Escape a string for embedding inside a JSON string literal. Control characters
/// below 0x20 are written as \u00XX.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Decode the body of a JSON string literal (without the surrounding quotes).
/// \uXXXX escapes are emitted as UTF-8; surrogate pairs are combined.
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Scanner helpers for the event JSON reader.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

} // namespace voxrelay::common
