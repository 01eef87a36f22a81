#include "uuid.hpp"

#include <fmt/format.h>

#include <cstdint>
#include <random>

namespace buildq::util {

std::string NewId() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};

  const uint64_t hi = (rng() & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
  const uint64_t lo = (rng() & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL; // RFC4122 variant

  return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}", hi >> 32, (hi >> 16) & 0xFFFF, hi & 0xFFFF, lo >> 48, lo & 0xFFFFFFFFFFFFULL);
}

} // namespace buildq::util
