#pragma once
#include <cstdint>
#include <cstddef>
#include <span>

namespace minhash {

// A hash family front end: value bytes -> 64-bit permutation seed.
struct IHash {
  virtual ~IHash() = default;
  virtual std::uint64_t operator()(std::span<const std::byte> key) const = 0;
  virtual void reseed(std::uint64_t s0, std::uint64_t s1 = 0) = 0;
};

} // namespace minhash
