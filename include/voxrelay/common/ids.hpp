#pragma once

#include <string>

namespace voxrelay::common {

/// Random RFC 4122 version 4 identifier, lowercase with dashes.
[[nodiscard]] std::string generate_uuid_v4();

/// Lowercase hex string of `bytes` random bytes.
[[nodiscard]] std::string random_hex(std::size_t bytes);

/// Seconds since the Unix epoch with sub-second precision.
[[nodiscard]] double epoch_seconds_now();

/// UTC timestamp like 2026-01-31T12:00:00.123Z.
[[nodiscard]] std::string iso8601_now();

} // namespace voxrelay::common
