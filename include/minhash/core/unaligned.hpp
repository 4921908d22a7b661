#pragma once
// Unaligned little-endian loads for the byte-oriented hashers.
// On little-endian hosts GET_U64 is a single memcpy; elsewhere it reassembles
// the bytes so digests are the same on every host.
#include <bit>
#include <cstdint>
#include <cstddef>
#include <cstring>

namespace minhash {

static inline std::uint64_t GET_U64(const std::byte* b, std::size_t i) {
  if constexpr (std::endian::native == std::endian::little) {
    std::uint64_t n;
    std::memcpy(&n, b + i, 8);
    return n;
  }
  else {
    std::uint64_t n = 0;
    for (std::size_t k = 0; k < 8; ++k) n |= std::uint64_t(std::to_integer<std::uint8_t>(b[i + k])) << (8 * k);
    return n;
  }
}

// Up to 7 trailing bytes, little-endian order, zero-padded.
static inline std::uint64_t GET_TAIL_U64(const std::byte* b, std::size_t n) {
  std::uint64_t t = 0;
  for (std::size_t i = 0; i < n; ++i) t |= std::uint64_t(std::to_integer<std::uint8_t>(b[i])) << (8 * i);
  return t;
}

} // namespace minhash
