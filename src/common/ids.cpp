#include "voxrelay/common/ids.hpp"

#include <array>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <openssl/rand.h>
#include <random>
#include <sstream>
#include <vector>

namespace voxrelay::common {

namespace {

void fill_random(unsigned char *data, std::size_t size) {
  if (RAND_bytes(data, static_cast<int>(size)) == 1) {
    return;
  }
  // OpenSSL's pool can be unseeded in stripped containers.
  std::random_device device;
  for (std::size_t i = 0; i < size; ++i) {
    data[i] = static_cast<unsigned char>(device() & 0xFFU);
  }
}

} // namespace

std::string generate_uuid_v4() {
  std::array<unsigned char, 16> bytes{};
  fill_random(bytes.data(), bytes.size());
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0FU) | 0x40U);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3FU) | 0x80U);

  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out << '-';
    }
    out << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return out.str();
}

std::string random_hex(const std::size_t bytes) {
  std::vector<unsigned char> data(bytes);
  fill_random(data.data(), data.size());

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const auto byte : data) {
    stream << std::setw(2) << static_cast<int>(byte);
  }
  return stream.str();
}

double epoch_seconds_now() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::chrono::duration<double>(now).count();
}

std::string iso8601_now() {
  const auto now = std::chrono::system_clock::now();
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
      1000;
  const std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  std::tm utc{};
  gmtime_r(&seconds, &utc);

  std::ostringstream out;
  out << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0')
      << millis << 'Z';
  return out.str();
}

} // namespace voxrelay::common
