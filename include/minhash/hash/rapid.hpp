#pragma once
// RapidHash front end (rapidhash library), seeded. Unkeyed uses RAPID_SEED.

#include <cstdint>
#include <cstddef>
#include <span>

#include <rapidhash.h>

#include "minhash/hash/ihash.hpp"

namespace minhash::hashfn {

    class RapidHash final : public IHash {
    public:
        RapidHash() = default;
        explicit RapidHash(std::uint64_t seed) : seed_(seed) {}

        void set_params(std::uint64_t seed) { seed_ = seed; }
        void reseed(std::uint64_t s0, std::uint64_t = 0) override { set_params(s0); }

        std::uint64_t operator()(std::span<const std::byte> key) const override {
            return rapidhash_withSeed(key.data(), key.size(), seed_);
        }

        inline std::uint64_t hash(const void* in, std::size_t len) const {
            return rapidhash_withSeed(in, len, seed_);
        }

        std::uint64_t seed() const { return seed_; }

    private:
        std::uint64_t seed_{ RAPID_SEED };
    };

} // namespace minhash::hashfn
