#pragma once
// 64-bit FNV over bytes: h ^= byte; h *= prime (xor-then-multiply order).
// Unkeyed starts from the offset basis; keyed starts from the caller's key.

#include <cstdint>
#include <cstddef>
#include <span>

#include "minhash/hash/ihash.hpp"

namespace minhash::hashfn {

    constexpr std::uint64_t FNV_OFFSET_BASIS = 0xCBF29CE484222325ull;
    constexpr std::uint64_t FNV_PRIME = 0x00000100000001B3ull;

    class Fnv final : public IHash {
    public:
        Fnv() = default;
        explicit Fnv(std::uint64_t key) : state_(key) {}

        void set_params(std::uint64_t key) { state_ = key; }
        void reseed(std::uint64_t s0, std::uint64_t = 0) override { set_params(s0); }

        std::uint64_t operator()(std::span<const std::byte> key) const override {
            std::uint64_t h = state_;
            for (std::byte b : key) {
                h ^= std::to_integer<std::uint64_t>(b);
                h *= FNV_PRIME;
            }
            return h;
        }

        inline std::uint64_t hash(const void* in, std::size_t len) const {
            return (*this)(std::span<const std::byte>(static_cast<const std::byte*>(in), len));
        }

        std::uint64_t key() const { return state_; }

    private:
        std::uint64_t state_{ FNV_OFFSET_BASIS };
    };

} // namespace minhash::hashfn
