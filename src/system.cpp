/**
 * @file system.cpp
 * @brief Identifier and time formatting implementation
 */

#include "keyout/system.hpp"

#include <cstdint>
#include <ctime>
#include <mutex>
#include <random>

#include <fmt/chrono.h>
#include <fmt/core.h>

namespace keyout {

// **---- Identifiers ----**

std::string generate_id() {
  static std::mutex rng_mutex;
  static std::mt19937_64 rng{std::random_device{}()};

  uint64_t hi;
  uint64_t lo;
  {
    std::lock_guard<std::mutex> lock(rng_mutex);
    hi = rng();
    lo = rng();
  }

  /// Version 4, RFC 4122 variant
  hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
  lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", hi >> 32,
                     (hi >> 16) & 0xFFFF, hi & 0xFFFF, lo >> 48,
                     lo & 0xFFFFFFFFFFFFULL);
}

bool is_valid_id(const std::string &id) {
  if (id.size() != 36)
    return false;
  for (size_t i = 0; i < id.size(); ++i) {
    char c = id[i];
    if (i == 8 || i == 13 || i == 18 || i == 23) {
      if (c != '-')
        return false;
      continue;
    }
    bool hex = (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    if (!hex)
      return false;
  }
  /// Version nibble and variant bits
  if (id[14] != '4')
    return false;
  char variant = id[19];
  return variant == '8' || variant == '9' || variant == 'a' || variant == 'b';
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", fmt::gmtime(t),
                     static_cast<int>(ms.count()));
}

} // namespace keyout
