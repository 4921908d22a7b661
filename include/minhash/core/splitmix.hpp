#pragma once
// SplitMix64 finalizer (Steele, Lea, Flood 2014), used as a pure scramble step.
// No state: the same input always gives the same output.

#include <cstdint>

namespace minhash {

    constexpr std::uint64_t SPLITMIX_C1 = 0xBF58476D1CE4E5B9ull;
    constexpr std::uint64_t SPLITMIX_C2 = 0x94D049BB133111EBull;
    constexpr std::uint64_t GOLDEN_GAMMA = 0x9E3779B97F4A7C15ull;

    constexpr std::uint64_t splitmix(std::uint64_t z) noexcept {
        z = (z ^ (z >> 30)) * SPLITMIX_C1;
        z = (z ^ (z >> 27)) * SPLITMIX_C2;
        return z ^ (z >> 31);
    }

    // Seed scramble applied before a permutation stream starts.
    constexpr int SEED_MIX_ROUNDS = 2;

    constexpr std::uint64_t mix_seed(std::uint64_t seed) noexcept {
        for (int r = 0; r < SEED_MIX_ROUNDS; ++r) seed = splitmix(seed);
        return seed;
    }

} // namespace minhash
