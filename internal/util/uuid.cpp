#include "internal/util/uuid.hpp"

#include <absl/strings/escaping.h>
#include <absl/strings/str_cat.h>

#include <cstdint>
#include <random>

namespace fieldwake::util {

namespace {

void PutBigEndian(uint64_t value, char* out) {
  for (int shift = 56; shift >= 0; shift -= 8) *out++ = static_cast<char>((value >> shift) & 0xFF);
}

} // namespace

std::string NewUUIDString() {
  static thread_local std::mt19937_64 engine{(static_cast<uint64_t>(std::random_device{}()) << 32) ^ std::random_device{}()};

  uint64_t high = engine();
  uint64_t low  = engine();
  high          = (high & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL; // version 4
  low           = (low & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;  // variant 10

  char raw[16];
  PutBigEndian(high, raw);
  PutBigEndian(low, raw + 8);

  const std::string hex = absl::BytesToHexString(absl::string_view(raw, sizeof(raw)));
  return absl::StrCat(hex.substr(0, 8), "-", hex.substr(8, 4), "-", hex.substr(12, 4), "-", hex.substr(16, 4), "-", hex.substr(20));
}

} // namespace fieldwake::util
